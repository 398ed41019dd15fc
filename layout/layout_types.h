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

#include <cstddef>

namespace spellscribe {

// Rectangle text may be written into, in page millimetres with y growing
// upwards. Nothing is written into a region without positive area.
struct FlowRegion {
  double xMin = 0.0;
  double xMax = 0.0;
  double yMin = 0.0;
  double yMax = 0.0;

  double Width() const { return xMax - xMin; }
  double Height() const { return yMax - yMin; }
  bool IsDegenerate() const { return !(xMin < xMax) || !(yMin < yMax); }
};

// Write position. y is the baseline of the next line.
struct Cursor {
  double x = 0.0;
  double y = 0.0;
};

using PageHandle = size_t;

} // namespace spellscribe
