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
#include "page_cursor.h"

namespace spellscribe {

void PageCursor::AdvanceLine(double height) {
  if (context_.freshBlock)
    context_.freshBlock = false;
  else
    context_.cursor.y -= height;
  if (context_.cursor.y <= context_.region.yMin)
    NextPage();
}

void PageCursor::Newline(double height) {
  context_.freshBlock = false;
  AdvanceLine(height);
}

void PageCursor::Settle() {
  context_.freshBlock = true;
  AdvanceLine(0.0);
}

void PageCursor::NextPage() {
  if (context_.pageIndex + 1 >= context_.pages.Size())
    context_.pages.Append(document_.NewPage());
  ++context_.pageIndex;
  context_.cursor.y = context_.region.yMax;
}

} // namespace spellscribe
