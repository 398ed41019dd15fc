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
#include "spellio.h"

#include "logger.h"
#include "stringutils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace spellscribe {

namespace {

using json = nlohmann::json;

class SpellFormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename E> struct NamedValue {
  const char *name;
  E value;
};

constexpr std::array<NamedValue<MagicSchool>, 8> kSchools = {{
    {"abjuration", MagicSchool::Abjuration},
    {"conjuration", MagicSchool::Conjuration},
    {"divination", MagicSchool::Divination},
    {"enchantment", MagicSchool::Enchantment},
    {"evocation", MagicSchool::Evocation},
    {"illusion", MagicSchool::Illusion},
    {"necromancy", MagicSchool::Necromancy},
    {"transmutation", MagicSchool::Transmutation},
}};

constexpr std::array<NamedValue<CastingTime::Unit>, 10> kCastingUnits = {{
    {"seconds", CastingTime::Unit::Seconds},
    {"actions", CastingTime::Unit::Actions},
    {"bonus_action", CastingTime::Unit::BonusAction},
    {"reaction", CastingTime::Unit::Reaction},
    {"minutes", CastingTime::Unit::Minutes},
    {"hours", CastingTime::Unit::Hours},
    {"days", CastingTime::Unit::Days},
    {"weeks", CastingTime::Unit::Weeks},
    {"months", CastingTime::Unit::Months},
    {"years", CastingTime::Unit::Years},
}};

constexpr std::array<NamedValue<AreaOfEffect::Shape>, 8> kShapes = {{
    {"line", AreaOfEffect::Shape::Line},
    {"cone", AreaOfEffect::Shape::Cone},
    {"cube", AreaOfEffect::Shape::Cube},
    {"sphere", AreaOfEffect::Shape::Sphere},
    {"hemisphere", AreaOfEffect::Shape::Hemisphere},
    {"cylinder", AreaOfEffect::Shape::Cylinder},
    {"emanation", AreaOfEffect::Shape::Emanation},
    {"radius", AreaOfEffect::Shape::Radius},
}};

constexpr std::array<NamedValue<Range::Kind>, 6> kRangeKinds = {{
    {"self", Range::Kind::Self},
    {"touch", Range::Kind::Touch},
    {"distance", Range::Kind::Distance},
    {"sight", Range::Kind::Sight},
    {"unlimited", Range::Kind::Unlimited},
    {"special", Range::Kind::Special},
}};

constexpr std::array<NamedValue<Duration::Kind>, 13> kDurationKinds = {{
    {"instantaneous", Duration::Kind::Instantaneous},
    {"seconds", Duration::Kind::Seconds},
    {"rounds", Duration::Kind::Rounds},
    {"minutes", Duration::Kind::Minutes},
    {"hours", Duration::Kind::Hours},
    {"days", Duration::Kind::Days},
    {"weeks", Duration::Kind::Weeks},
    {"months", Duration::Kind::Months},
    {"years", Duration::Kind::Years},
    {"until_dispelled_or_triggered", Duration::Kind::UntilDispelledOrTriggered},
    {"until_dispelled", Duration::Kind::UntilDispelled},
    {"permanent", Duration::Kind::Permanent},
    {"special", Duration::Kind::Special},
}};

std::string Lowercase(std::string text) {
  for (char &c : text)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return text;
}

template <typename E, size_t N>
bool FindValue(const std::array<NamedValue<E>, N> &table,
               const std::string &name, E &out) {
  std::string key = Lowercase(name);
  for (const auto &entry : table) {
    if (key == entry.name) {
      out = entry.value;
      return true;
    }
  }
  return false;
}

template <typename E, size_t N>
const char *NameOf(const std::array<NamedValue<E>, N> &table, E value) {
  for (const auto &entry : table) {
    if (entry.value == value)
      return entry.name;
  }
  return "";
}

template <typename E, size_t N>
E RequireValue(const std::array<NamedValue<E>, N> &table, const json &object,
               const char *field, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string())
    throw SpellFormatError(std::string(field) + "." + key +
                           " must be a string.");
  E value{};
  if (!FindValue(table, it->get<std::string>(), value))
    throw SpellFormatError("Unknown " + std::string(field) + "." + key + " '" +
                           it->get<std::string>() + "'.");
  return value;
}

int ReadAmount(const json &object, const char *field, int fallback) {
  auto it = object.find("amount");
  if (it == object.end())
    return fallback;
  if (!it->is_number_integer() || it->get<int>() < 0)
    throw SpellFormatError(std::string(field) +
                           ".amount must be a non-negative integer.");
  return it->get<int>();
}

bool ReadFlag(const json &object, const char *field, const char *key) {
  auto it = object.find(key);
  if (it == object.end())
    return false;
  if (!it->is_boolean())
    throw SpellFormatError(std::string(field) + "." + key +
                           " must be true or false.");
  return it->get<bool>();
}

const json &RequireObject(const json &value, const char *field) {
  if (!value.is_object())
    throw SpellFormatError(std::string(field) +
                           " must be an object or a string.");
  return value;
}

// {"feet": 30} or {"miles": 1}.
Distance ParseDistance(const json &value, const char *field) {
  if (!value.is_object() || value.size() != 1)
    throw SpellFormatError(std::string(field) +
                           " must be {\"feet\": n} or {\"miles\": n}.");
  Distance distance;
  auto it = value.begin();
  if (it.key() == "feet")
    distance.unit = Distance::Unit::Feet;
  else if (it.key() == "miles")
    distance.unit = Distance::Unit::Miles;
  else
    throw SpellFormatError("Unknown distance unit '" + it.key() + "' in " +
                           field + ".");
  if (!it->is_number_integer() || it->get<int>() < 0)
    throw SpellFormatError(std::string(field) +
                           " must be a non-negative integer.");
  distance.amount = it->get<int>();
  return distance;
}

json DistanceToJson(const Distance &distance) {
  return json{{distance.unit == Distance::Unit::Miles ? "miles" : "feet",
               distance.amount}};
}

SpellField<Level> ParseLevel(const json &value) {
  if (value.is_string())
    return SpellField<Level>::Custom(value.get<std::string>());
  if (!value.is_number_integer() || value.get<int>() < 0 ||
      value.get<int>() > 9)
    throw SpellFormatError("level must be an integer from 0 to 9 or a string.");
  return static_cast<Level>(value.get<int>());
}

SpellField<MagicSchool> ParseSchool(const json &value) {
  if (!value.is_string())
    throw SpellFormatError("school must be a string.");
  MagicSchool school{};
  if (FindValue(kSchools, value.get<std::string>(), school))
    return school;
  return SpellField<MagicSchool>::Custom(value.get<std::string>());
}

SpellField<CastingTime> ParseCastingTime(const json &value) {
  if (value.is_string())
    return SpellField<CastingTime>::Custom(value.get<std::string>());
  const json &object = RequireObject(value, "casting_time");
  CastingTime time;
  time.unit = RequireValue(kCastingUnits, object, "casting_time", "unit");
  time.amount = ReadAmount(object, "casting_time", 1);
  auto trigger = object.find("trigger");
  if (trigger != object.end()) {
    if (!trigger->is_string())
      throw SpellFormatError("casting_time.trigger must be a string.");
    time.trigger = trigger->get<std::string>();
  }
  return time;
}

SpellField<Range> ParseRange(const json &value) {
  if (value.is_string())
    return SpellField<Range>::Custom(value.get<std::string>());
  const json &object = RequireObject(value, "range");
  Range range;
  range.kind = RequireValue(kRangeKinds, object, "range", "type");
  if (range.kind == Range::Kind::Distance) {
    auto distance = object.find("distance");
    if (distance == object.end())
      throw SpellFormatError("range.distance is required for type distance.");
    range.distance = ParseDistance(*distance, "range.distance");
  }
  auto area = object.find("aoe");
  if (area != object.end() && !area->is_null()) {
    if (!area->is_object())
      throw SpellFormatError("range.aoe must be an object.");
    AreaOfEffect aoe;
    aoe.shape = RequireValue(kShapes, *area, "range.aoe", "shape");
    auto size = area->find("size");
    if (size == area->end())
      throw SpellFormatError("range.aoe.size is required.");
    aoe.size = ParseDistance(*size, "range.aoe.size");
    if (aoe.shape == AreaOfEffect::Shape::Cylinder) {
      auto height = area->find("height");
      if (height == area->end())
        throw SpellFormatError("range.aoe.height is required for cylinders.");
      aoe.height = ParseDistance(*height, "range.aoe.height");
    }
    range.area = aoe;
  }
  return range;
}

SpellField<Duration> ParseDuration(const json &value) {
  if (value.is_string())
    return SpellField<Duration>::Custom(value.get<std::string>());
  const json &object = RequireObject(value, "duration");
  Duration duration;
  duration.kind = RequireValue(kDurationKinds, object, "duration", "type");
  duration.amount = ReadAmount(object, "duration", 1);
  duration.concentration = ReadFlag(object, "duration", "concentration");
  return duration;
}

std::vector<std::string> ParseStringList(const json &value,
                                         const std::string &field) {
  if (!value.is_array())
    throw SpellFormatError(field + " must be an array of strings.");
  std::vector<std::string> items;
  for (const json &item : value) {
    if (!item.is_string())
      throw SpellFormatError(field + " must be an array of strings.");
    items.push_back(item.get<std::string>());
  }
  return items;
}

SpellTable ParseTable(const json &value, size_t index) {
  std::string field = "tables[" + std::to_string(index) + "]";
  if (!value.is_object())
    throw SpellFormatError(field + " must be an object.");
  SpellTable table;
  auto title = value.find("title");
  if (title != value.end()) {
    if (!title->is_string())
      throw SpellFormatError(field + ".title must be a string.");
    table.title = title->get<std::string>();
  }
  auto labels = value.find("column_labels");
  if (labels != value.end())
    table.columnLabels = ParseStringList(*labels, field + ".column_labels");
  auto cells = value.find("cells");
  if (cells != value.end()) {
    if (!cells->is_array())
      throw SpellFormatError(field + ".cells must be an array of rows.");
    for (size_t r = 0; r < cells->size(); ++r)
      table.cells.push_back(ParseStringList(
          (*cells)[r], field + ".cells[" + std::to_string(r) + "]"));
  }
  return table;
}

std::string RequireString(const json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string())
    throw SpellFormatError(std::string(key) + " must be a string.");
  return it->get<std::string>();
}

const json &RequireField(const json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end())
    throw SpellFormatError(std::string("Missing field ") + key + ".");
  return *it;
}

Spell ParseSpell(const json &value) {
  if (!value.is_object())
    throw SpellFormatError("A spell must be a JSON object.");
  Spell spell;
  spell.name = RequireString(value, "name");
  spell.level = ParseLevel(RequireField(value, "level"));
  spell.school = ParseSchool(RequireField(value, "school"));
  spell.isRitual = ReadFlag(value, "spell", "is_ritual");
  spell.castingTime = ParseCastingTime(RequireField(value, "casting_time"));
  spell.range = ParseRange(RequireField(value, "range"));
  spell.duration = ParseDuration(RequireField(value, "duration"));

  auto components = value.find("components");
  if (components != value.end()) {
    if (!components->is_object())
      throw SpellFormatError("components must be an object.");
    spell.hasVerbal = ReadFlag(*components, "components", "v");
    spell.hasSomatic = ReadFlag(*components, "components", "s");
    auto material = components->find("m");
    if (material != components->end() && !material->is_null()) {
      if (!material->is_string())
        throw SpellFormatError("components.m must be a string.");
      spell.materials = material->get<std::string>();
    }
  }

  spell.description = RequireString(value, "description");
  auto upcast = value.find("upcast_description");
  if (upcast != value.end() && !upcast->is_null()) {
    if (!upcast->is_string())
      throw SpellFormatError("upcast_description must be a string.");
    spell.upcastDescription = upcast->get<std::string>();
  }

  auto tables = value.find("tables");
  if (tables != value.end()) {
    if (!tables->is_array())
      throw SpellFormatError("tables must be an array.");
    for (size_t i = 0; i < tables->size(); ++i)
      spell.tables.push_back(ParseTable((*tables)[i], i));
  }
  return spell;
}

template <typename T, typename Encode>
json FieldToJson(const SpellField<T> &field, Encode encode) {
  if (const std::string *custom = field.CustomText())
    return *custom;
  return encode(*field.Controlled());
}

} // namespace

bool SpellFromJson(const json &value, Spell &spell, std::string &error) {
  try {
    spell = ParseSpell(value);
  } catch (const SpellFormatError &e) {
    error = e.what();
    return false;
  } catch (const json::exception &e) {
    error = e.what();
    return false;
  }
  return true;
}

json SpellToJson(const Spell &spell) {
  json value;
  value["name"] = spell.name;
  value["level"] = FieldToJson(
      spell.level, [](Level level) { return json(static_cast<int>(level)); });
  value["school"] = FieldToJson(spell.school, [](MagicSchool school) {
    return json(NameOf(kSchools, school));
  });
  value["is_ritual"] = spell.isRitual;
  value["casting_time"] =
      FieldToJson(spell.castingTime, [](const CastingTime &time) {
        json object{{"unit", NameOf(kCastingUnits, time.unit)},
                    {"amount", time.amount}};
        if (!time.trigger.empty())
          object["trigger"] = time.trigger;
        return object;
      });
  value["range"] = FieldToJson(spell.range, [](const Range &range) {
    json object{{"type", NameOf(kRangeKinds, range.kind)}};
    if (range.kind == Range::Kind::Distance)
      object["distance"] = DistanceToJson(range.distance);
    if (range.area) {
      json area{{"shape", NameOf(kShapes, range.area->shape)},
                {"size", DistanceToJson(range.area->size)}};
      if (range.area->shape == AreaOfEffect::Shape::Cylinder)
        area["height"] = DistanceToJson(range.area->height);
      object["aoe"] = area;
    }
    return object;
  });
  value["components"] = {{"v", spell.hasVerbal}, {"s", spell.hasSomatic}};
  if (spell.materials)
    value["components"]["m"] = *spell.materials;
  value["duration"] = FieldToJson(spell.duration, [](const Duration &duration) {
    return json{{"type", NameOf(kDurationKinds, duration.kind)},
                {"amount", duration.amount},
                {"concentration", duration.concentration}};
  });
  value["description"] = spell.description;
  if (spell.upcastDescription)
    value["upcast_description"] = *spell.upcastDescription;
  if (!spell.tables.empty()) {
    json tables = json::array();
    for (const SpellTable &table : spell.tables)
      tables.push_back(json{{"title", table.title},
                             {"column_labels", table.columnLabels},
                             {"cells", table.cells}});
    value["tables"] = tables;
  }
  return value;
}

bool LoadSpellFromFile(const std::filesystem::path &path, Spell &spell,
                       std::string &error) {
  std::ifstream in(path);
  if (!in.is_open()) {
    error = "Unable to open " + path.string();
    return false;
  }
  json value = json::parse(in, nullptr, false);
  if (value.is_discarded()) {
    error = path.string() + ": invalid JSON.";
    return false;
  }
  std::string detail;
  if (!SpellFromJson(value, spell, detail)) {
    error = path.string() + ": " + detail;
    return false;
  }
  return true;
}

bool SaveSpellToFile(const std::filesystem::path &path, const Spell &spell,
                     std::string &error) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    error = "Unable to write " + path.string();
    return false;
  }
  out << SpellToJson(spell).dump(2) << '\n';
  if (!out.good()) {
    error = "Failed writing " + path.string();
    return false;
  }
  return true;
}

bool LoadSpellsFromFolder(const std::filesystem::path &folder,
                          std::vector<Spell> &spells, std::string &error) {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    error = "Spell folder not found: " + folder.string();
    return false;
  }

  std::vector<std::filesystem::path> files;
  for (const auto &entry : std::filesystem::directory_iterator(folder, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json")
      files.push_back(entry.path());
  }
  if (ec) {
    error = "Unable to list " + folder.string() + ": " + ec.message();
    return false;
  }
  std::sort(files.begin(), files.end(),
            [](const std::filesystem::path &a, const std::filesystem::path &b) {
              return StringUtils::NaturalLess(a.stem().string(),
                                              b.stem().string());
            });

  std::vector<Spell> loaded;
  for (const auto &file : files) {
    Spell spell;
    if (!LoadSpellFromFile(file, spell, error))
      return false;
    Logger::Instance().Log("Loaded spell '" + spell.name + "' from " +
                           file.filename().string());
    loaded.push_back(std::move(spell));
  }
  spells = std::move(loaded);
  return true;
}

} // namespace spellscribe
