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
#include "spell.h"

#include <cctype>

namespace spellscribe {

namespace {

std::string Ordinal(int n) {
  const char *suffix = "th";
  if (n % 100 < 11 || n % 100 > 13) {
    switch (n % 10) {
    case 1:
      suffix = "st";
      break;
    case 2:
      suffix = "nd";
      break;
    case 3:
      suffix = "rd";
      break;
    default:
      break;
    }
  }
  return std::to_string(n) + suffix;
}

std::string Lowercase(std::string text) {
  for (char &c : text)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return text;
}

// "30-foot", "1-mile".
std::string CompoundDistance(const Distance &distance) {
  return std::to_string(distance.amount) +
         (distance.unit == Distance::Unit::Miles ? "-mile" : "-foot");
}

std::string DurationAmountText(const Duration &duration) {
  switch (duration.kind) {
  case Duration::Kind::Seconds:
    return AmountText(duration.amount, "second");
  case Duration::Kind::Rounds:
    return AmountText(duration.amount, "round");
  case Duration::Kind::Minutes:
    return AmountText(duration.amount, "minute");
  case Duration::Kind::Hours:
    return AmountText(duration.amount, "hour");
  case Duration::Kind::Days:
    return AmountText(duration.amount, "day");
  case Duration::Kind::Weeks:
    return AmountText(duration.amount, "week");
  case Duration::Kind::Months:
    return AmountText(duration.amount, "month");
  case Duration::Kind::Years:
    return AmountText(duration.amount, "year");
  default:
    return {};
  }
}

} // namespace

std::string AmountText(int amount, const std::string &unit) {
  std::string text = std::to_string(amount) + " " + unit;
  if (amount != 1)
    text += "s";
  return text;
}

std::string ToText(Level level) {
  if (level == Level::Cantrip)
    return "Cantrip";
  return Ordinal(static_cast<int>(level)) + "-Level";
}

std::string ToText(MagicSchool school) {
  switch (school) {
  case MagicSchool::Abjuration:
    return "Abjuration";
  case MagicSchool::Conjuration:
    return "Conjuration";
  case MagicSchool::Divination:
    return "Divination";
  case MagicSchool::Enchantment:
    return "Enchantment";
  case MagicSchool::Evocation:
    return "Evocation";
  case MagicSchool::Illusion:
    return "Illusion";
  case MagicSchool::Necromancy:
    return "Necromancy";
  case MagicSchool::Transmutation:
    return "Transmutation";
  }
  return {};
}

std::string ToText(const CastingTime &time) {
  switch (time.unit) {
  case CastingTime::Unit::Seconds:
    return AmountText(time.amount, "second");
  case CastingTime::Unit::Actions:
    return AmountText(time.amount, "action");
  case CastingTime::Unit::BonusAction:
    return "1 bonus action";
  case CastingTime::Unit::Reaction:
    if (time.trigger.empty())
      return "1 reaction";
    return "1 reaction, which you take when " + time.trigger;
  case CastingTime::Unit::Minutes:
    return AmountText(time.amount, "minute");
  case CastingTime::Unit::Hours:
    return AmountText(time.amount, "hour");
  case CastingTime::Unit::Days:
    return AmountText(time.amount, "day");
  case CastingTime::Unit::Weeks:
    return AmountText(time.amount, "week");
  case CastingTime::Unit::Months:
    return AmountText(time.amount, "month");
  case CastingTime::Unit::Years:
    return AmountText(time.amount, "year");
  }
  return {};
}

std::string ToText(const Distance &distance) {
  if (distance.unit == Distance::Unit::Miles)
    return AmountText(distance.amount, "mile");
  return std::to_string(distance.amount) +
         (distance.amount == 1 ? " foot" : " feet");
}

std::string ToText(const AreaOfEffect &area) {
  std::string size = CompoundDistance(area.size);
  switch (area.shape) {
  case AreaOfEffect::Shape::Line:
    return size + " line";
  case AreaOfEffect::Shape::Cone:
    return size + " cone";
  case AreaOfEffect::Shape::Cube:
    return size + " cube";
  case AreaOfEffect::Shape::Sphere:
    return size + " sphere";
  case AreaOfEffect::Shape::Hemisphere:
    return size + " hemisphere";
  case AreaOfEffect::Shape::Cylinder:
    return size + " radius, " + CompoundDistance(area.height) +
           " tall cylinder";
  case AreaOfEffect::Shape::Emanation:
    return size + " emanation";
  case AreaOfEffect::Shape::Radius:
    return size + " radius";
  }
  return {};
}

std::string ToText(const Range &range) {
  switch (range.kind) {
  case Range::Kind::Self:
    if (range.area)
      return "Self (" + ToText(*range.area) + ")";
    return "Self";
  case Range::Kind::Touch:
    return "Touch";
  case Range::Kind::Distance:
    return ToText(range.distance);
  case Range::Kind::Sight:
    return "Sight";
  case Range::Kind::Unlimited:
    return "Unlimited";
  case Range::Kind::Special:
    return "Special";
  }
  return {};
}

std::string ToText(const Duration &duration) {
  std::string text;
  switch (duration.kind) {
  case Duration::Kind::Instantaneous:
    return "Instantaneous";
  case Duration::Kind::Permanent:
    return "Permanent";
  case Duration::Kind::UntilDispelledOrTriggered:
    text = "until dispelled or triggered";
    break;
  case Duration::Kind::UntilDispelled:
    text = "until dispelled";
    break;
  case Duration::Kind::Special:
    text = "special";
    break;
  default:
    if (duration.concentration)
      return "Concentration, up to " + DurationAmountText(duration);
    return DurationAmountText(duration);
  }
  if (duration.concentration)
    return "Concentration, " + text;
  text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
  return text;
}

bool Spell::IsCantrip() const {
  const Level *controlled = level.Controlled();
  return controlled && *controlled == Level::Cantrip;
}

std::string Spell::ComponentsText() const {
  std::string text;
  auto append = [&text](const std::string &part) {
    if (!text.empty())
      text += ", ";
    text += part;
  };
  if (hasVerbal)
    append("V");
  if (hasSomatic)
    append("S");
  if (materials)
    append("M (" + *materials + ")");
  if (text.empty())
    return "None";
  return text;
}

std::string Spell::LevelSchoolText() const {
  std::string text;
  if (level.IsCustom() || school.IsCustom()) {
    text = level.Text() + " " + school.Text();
  } else if (IsCantrip()) {
    text = school.Text() + " cantrip";
  } else {
    text = Lowercase(level.Text()) + " " + Lowercase(school.Text());
  }
  if (isRitual)
    text += " (ritual)";
  return text;
}

std::string Spell::FullDescription() const {
  if (!upcastDescription)
    return description;
  const char *prefix =
      IsCantrip() ? "Cantrip Upgrade." : "Using a Higher-Level Spell Slot.";
  return description + "\n<bi> " + prefix + " <r> " + *upcastDescription;
}

} // namespace spellscribe
