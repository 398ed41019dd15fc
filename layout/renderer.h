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

#include "layout_types.h"
#include "typography.h"

#include <string>

namespace spellscribe {

// Drawing surface the layout engine writes to. Coordinates are page
// millimetres from the bottom-left corner.
class Renderer {
public:
  virtual ~Renderer() = default;

  // Creates an empty page, already carrying the background image if any.
  virtual PageHandle CreatePage(double width, double height) = 0;

  virtual void DrawText(PageHandle page, double x, double y,
                        const std::string &text, Style style, double size,
                        const Color &color) = 0;

  virtual void DrawLineSegment(PageHandle page, double x1, double y1,
                               double x2, double y2, const Color &color,
                               double thickness) = 0;

  // Adds a document outline entry pointing at the page.
  virtual void AddBookmark(const std::string &title, PageHandle page) = 0;
};

} // namespace spellscribe
