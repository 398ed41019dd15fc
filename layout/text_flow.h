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

#include "document.h"
#include "page_cursor.h"
#include "spellbookconfig.h"

#include <string>
#include <vector>

namespace spellscribe {

// Flows newline-separated paragraphs of a single style into a region.
//
// The first paragraph starts exactly at the context's cursor, so text can
// continue on a line a label was written to. Every later paragraph starts on
// a new line indented by the tab amount. A paragraph whose first token is
// "-" or a bullet character is drawn as a bullet with a hanging indent.
// Empty paragraphs are skipped and a degenerate region draws nothing.
class TextFlowEngine {
public:
  TextFlowEngine(Document &document, const TextColors &colors);

  // Returns the final cursor: x just after the last character, y on the last
  // baseline. context.pages holds every page the text touched.
  Cursor Flow(LayoutContext &context, const std::string &text, Style style,
              TextClass textClass);

  // Writes prepared lines centered between xMin and xMax. The first line sits
  // on the current y.
  Cursor FlowCentered(LayoutContext &context,
                      const std::vector<std::string> &lines, double xMin,
                      double xMax, Style style, TextClass textClass);

private:
  void StartBulletBoundary(PageCursor &cursor, LayoutContext &context,
                           bool bullet, double newline);

  Document &document_;
  const TextColors &colors_;
};

} // namespace spellscribe
