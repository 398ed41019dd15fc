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
#include "layout_types.h"

#include <vector>

namespace spellscribe {

// Pages touched while flowing one block. Index 0 is the page that was active
// when the block started; entries are appended only when the cursor runs off
// the bottom of the last one.
class FlowSequence {
public:
  explicit FlowSequence(PageHandle first) : pages_{first} {}

  PageHandle At(size_t index) const { return pages_.at(index); }
  size_t Size() const { return pages_.size(); }
  void Append(PageHandle page) { pages_.push_back(page); }
  const std::vector<PageHandle> &Pages() const { return pages_; }

private:
  std::vector<PageHandle> pages_;
};

struct LayoutSnapshot {
  Cursor cursor;
  size_t pageIndex = 0;
  bool freshBlock = true;
};

// Mutable state of one logical write (a field, a description, a table). The
// caller carries cursor and CurrentPage() forward into the next write.
struct LayoutContext {
  LayoutContext(const FlowRegion &flowRegion, const Cursor &start,
                PageHandle page)
      : region(flowRegion), cursor(start), pages(page),
        lineStartX(flowRegion.xMin) {}

  PageHandle CurrentPage() const { return pages.At(pageIndex); }

  LayoutSnapshot Save() const { return {cursor, pageIndex, freshBlock}; }
  void Restore(const LayoutSnapshot &snapshot) {
    cursor = snapshot.cursor;
    pageIndex = snapshot.pageIndex;
    freshBlock = snapshot.freshBlock;
  }

  FlowRegion region;
  Cursor cursor;
  FlowSequence pages;
  size_t pageIndex = 0;
  // Set while no line of the current block has been placed.
  bool freshBlock = true;
  // Where wrapped lines start; differs from region.xMin under a bullet.
  double lineStartX;
  bool inBulletList = false;
  // The cursor was already moved to the start of a new paragraph line.
  bool paragraphStart = false;
  // Anything drawn yet by this context.
  bool hasContent = false;
};

// Moves the write position line by line and handles page breaks.
class PageCursor {
public:
  PageCursor(LayoutContext &context, Document &document)
      : context_(context), document_(document) {}

  // Positions the next line. The first call after BeginBlock() keeps y; later
  // calls move down by `height`. A baseline at or below the region bottom
  // moves to the top of the next page.
  void AdvanceLine(double height);

  void BeginBlock() { context_.freshBlock = true; }

  // Moves down one line regardless of block state.
  void Newline(double height);

  // Keeps y but breaks the page when y is already past the bottom.
  void Settle();

  // Next page of the sequence, created on demand. y resets to the region top.
  void NextPage();

private:
  LayoutContext &context_;
  Document &document_;
};

} // namespace spellscribe
