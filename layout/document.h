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
#include "metrics_adapter.h"
#include "renderer.h"
#include "spellbookconfig.h"

#include <optional>
#include <vector>

namespace spellscribe {

// The ordered page list of the output. Pages are only ever appended, in
// document order, and numbered as they are created.
class Document {
public:
  Document(Renderer &renderer, const MetricsAdapter &metrics,
           const PageSizeOptions &page,
           const std::optional<PageNumberOptions> &pageNumbers);

  PageHandle NewPage(bool numbered = true);

  // Page minus its margins.
  FlowRegion TextRegion() const;

  size_t PageCount() const { return pages_.size(); }
  const std::vector<PageHandle> &Pages() const { return pages_; }
  const PageSizeOptions &PageSize() const { return page_; }
  Renderer &Output() { return renderer_; }
  const MetricsAdapter &Metrics() const { return metrics_; }

private:
  void DrawPageNumber(PageHandle page);

  Renderer &renderer_;
  const MetricsAdapter &metrics_;
  PageSizeOptions page_;
  std::optional<PageNumberOptions> pageNumbers_;
  std::vector<PageHandle> pages_;
  int nextNumber_ = 1;
  PageSide nextSide_ = PageSide::Left;
};

} // namespace spellscribe
