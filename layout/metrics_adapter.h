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

#include "font_metrics_provider.h"
#include "spellbookconfig.h"
#include "typography.h"

#include <array>
#include <memory>
#include <string>

namespace spellscribe {

using FontMetricsSet = std::array<std::shared_ptr<const FontMetricsProvider>, 4>;

// Converts font metrics into page millimetres for every style and text class.
// Throws MetricsUnavailable when a style has no usable metrics.
class MetricsAdapter {
public:
  MetricsAdapter(FontMetricsSet fonts, const FontScalars &scalars,
                 const FontSizes &sizes, const SpacingOptions &spacing);

  double Width(const std::string &text, Style style, double size) const;
  double Width(const std::string &text, Style style,
               TextClass textClass) const;
  double LineHeight(Style style, double size) const;

  // Height of `lines` stacked lines: zero for none, otherwise
  // (lines - 1) * newline + line height.
  double TextHeight(size_t lines, Style style, TextClass textClass) const;

  double SpaceWidth(Style style, TextClass textClass) const;
  double FontSize(TextClass textClass) const { return sizes_.For(textClass); }
  double Newline(TextClass textClass) const {
    return spacing_.NewlineFor(textClass);
  }
  double TabAmount() const { return spacing_.tabAmount; }

private:
  const FontMetricsProvider &Font(Style style) const {
    return *fonts_[StyleIndex(style)];
  }

  FontMetricsSet fonts_;
  FontScalars scalars_;
  FontSizes sizes_;
  SpacingOptions spacing_;
  std::array<std::array<double, 4>, 5> spaceWidths_{};
};

} // namespace spellscribe
