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

#include "spell.h"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace spellscribe {

// Converts between spell records and their JSON form. Categorical fields
// accept either the structured form or a plain string, which becomes a
// custom value.
bool SpellFromJson(const nlohmann::json &value, Spell &spell,
                   std::string &error);
nlohmann::json SpellToJson(const Spell &spell);

bool LoadSpellFromFile(const std::filesystem::path &path, Spell &spell,
                       std::string &error);
bool SaveSpellToFile(const std::filesystem::path &path, const Spell &spell,
                     std::string &error);

// Loads every *.json file in the folder, ordered by natural filename order.
// Stops at the first malformed file.
bool LoadSpellsFromFolder(const std::filesystem::path &folder,
                          std::vector<Spell> &spells, std::string &error);

} // namespace spellscribe
