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

#include <stdexcept>
#include <string>

namespace spellscribe {

// Raised while building or loading a configuration object. Layout code never
// throws it.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &message)
      : std::runtime_error(message) {}
};

// A font could not be read or parsed. Raised before any page is produced.
class MetricsUnavailable : public std::runtime_error {
public:
  explicit MetricsUnavailable(const std::string &message)
      : std::runtime_error(message) {}
};

} // namespace spellscribe
