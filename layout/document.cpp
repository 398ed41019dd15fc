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
#include "document.h"

#include <string>

namespace spellscribe {

Document::Document(Renderer &renderer, const MetricsAdapter &metrics,
                   const PageSizeOptions &page,
                   const std::optional<PageNumberOptions> &pageNumbers)
    : renderer_(renderer), metrics_(metrics), page_(page),
      pageNumbers_(pageNumbers) {
  if (pageNumbers_) {
    nextNumber_ = pageNumbers_->startingNumber;
    nextSide_ = pageNumbers_->startingSide;
  }
}

PageHandle Document::NewPage(bool numbered) {
  PageHandle page = renderer_.CreatePage(page_.width, page_.height);
  pages_.push_back(page);
  if (numbered && pageNumbers_)
    DrawPageNumber(page);
  return page;
}

FlowRegion Document::TextRegion() const {
  return {page_.leftMargin, page_.width - page_.rightMargin,
          page_.bottomMargin, page_.height - page_.topMargin};
}

void Document::DrawPageNumber(PageHandle page) {
  const PageNumberOptions &options = *pageNumbers_;
  const std::string text = std::to_string(nextNumber_);
  double x = options.sideMargin;
  if (nextSide_ == PageSide::Right) {
    x = page_.width - options.sideMargin -
        metrics_.Width(text, options.style, options.fontSize);
  }
  renderer_.DrawText(page, x, options.bottomMargin, text, options.style,
                     options.fontSize, options.color);
  ++nextNumber_;
  if (options.flipsSides)
    nextSide_ = nextSide_ == PageSide::Left ? PageSide::Right : PageSide::Left;
}

} // namespace spellscribe
