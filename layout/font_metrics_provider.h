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

#include <string>

namespace spellscribe {

// Glyph metrics of one font face, in font design units.
class FontMetricsProvider {
public:
  virtual ~FontMetricsProvider() = default;

  // Sum of the advance widths of the UTF-8 string, zero tracking, no kerning.
  virtual double AdvanceUnits(const std::string &text) const = 0;
  virtual int UnitsPerEm() const = 0;
  virtual int Ascent() const = 0;
  // Negative below the baseline.
  virtual int Descent() const = 0;
};

} // namespace spellscribe
