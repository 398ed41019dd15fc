/*
 * This file is part of Spellscribe.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Spellscribe is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Spellscribe is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Spellscribe. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace spellscribe {

enum class Level {
  Cantrip,
  Level1,
  Level2,
  Level3,
  Level4,
  Level5,
  Level6,
  Level7,
  Level8,
  Level9
};

enum class MagicSchool {
  Abjuration,
  Conjuration,
  Divination,
  Enchantment,
  Evocation,
  Illusion,
  Necromancy,
  Transmutation
};

struct CastingTime {
  enum class Unit {
    Seconds,
    Actions,
    BonusAction,
    Reaction,
    Minutes,
    Hours,
    Days,
    Weeks,
    Months,
    Years
  };

  Unit unit = Unit::Actions;
  int amount = 1;
  // Reaction only: completes "1 reaction, which you take when ...".
  std::string trigger;
};

struct Distance {
  enum class Unit { Feet, Miles };

  Unit unit = Unit::Feet;
  int amount = 0;
};

struct AreaOfEffect {
  enum class Shape {
    Line,
    Cone,
    Cube,
    Sphere,
    Hemisphere,
    Cylinder,
    Emanation,
    Radius
  };

  Shape shape = Shape::Sphere;
  // Length, edge or radius depending on the shape.
  Distance size;
  // Cylinder only.
  Distance height;
};

struct Range {
  enum class Kind { Self, Touch, Distance, Sight, Unlimited, Special };

  Kind kind = Kind::Self;
  spellscribe::Distance distance;
  std::optional<AreaOfEffect> area;
};

struct Duration {
  enum class Kind {
    Instantaneous,
    Seconds,
    Rounds,
    Minutes,
    Hours,
    Days,
    Weeks,
    Months,
    Years,
    UntilDispelledOrTriggered,
    UntilDispelled,
    Permanent,
    Special
  };

  Kind kind = Kind::Instantaneous;
  int amount = 1;
  bool concentration = false;
};

std::string ToText(Level level);
std::string ToText(MagicSchool school);
std::string ToText(const CastingTime &time);
std::string ToText(const Distance &distance);
std::string ToText(const AreaOfEffect &area);
std::string ToText(const Range &range);
std::string ToText(const Duration &duration);

// "1 minute", "10 minutes".
std::string AmountText(int amount, const std::string &unit);

// A categorical spell property: either one of the known values or free text
// for homebrew content.
template <typename T> class SpellField {
public:
  SpellField(T value) : value_(std::move(value)) {}

  static SpellField Custom(std::string text) {
    SpellField field{T{}};
    field.value_ = std::move(text);
    return field;
  }

  bool IsCustom() const { return std::holds_alternative<std::string>(value_); }
  const T *Controlled() const { return std::get_if<T>(&value_); }
  const std::string *CustomText() const {
    return std::get_if<std::string>(&value_);
  }

  std::string Text() const {
    if (const std::string *custom = CustomText())
      return *custom;
    return ToText(std::get<T>(value_));
  }

private:
  std::variant<T, std::string> value_;
};

struct SpellTable {
  std::string title;
  std::vector<std::string> columnLabels;
  std::vector<std::vector<std::string>> cells;
};

struct Spell {
  std::string name;
  SpellField<Level> level = Level::Cantrip;
  SpellField<MagicSchool> school = MagicSchool::Abjuration;
  bool isRitual = false;
  SpellField<CastingTime> castingTime = CastingTime{};
  SpellField<Range> range = Range{};
  bool hasVerbal = false;
  bool hasSomatic = false;
  std::optional<std::string> materials;
  SpellField<Duration> duration = Duration{};
  // Marked-up text, see the markup writer for the tags.
  std::string description;
  std::optional<std::string> upcastDescription;
  std::vector<SpellTable> tables;

  bool IsCantrip() const;
  // "V, S, M (a pinch of sulfur)".
  std::string ComponentsText() const;
  // "3rd-level evocation", "Conjuration cantrip", "1st-level divination
  // (ritual)".
  std::string LevelSchoolText() const;
  // Description with the upcast paragraph appended.
  std::string FullDescription() const;
};

} // namespace spellscribe
