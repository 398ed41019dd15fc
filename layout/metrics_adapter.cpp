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
#include "metrics_adapter.h"

#include "errors.h"

#include <utility>

namespace spellscribe {

MetricsAdapter::MetricsAdapter(FontMetricsSet fonts, const FontScalars &scalars,
                               const FontSizes &sizes,
                               const SpacingOptions &spacing)
    : fonts_(std::move(fonts)), scalars_(scalars), sizes_(sizes),
      spacing_(spacing) {
  for (Style style : kAllStyles) {
    const auto &font = fonts_[StyleIndex(style)];
    if (!font)
      throw MetricsUnavailable(std::string("No metrics for the ") +
                               StyleName(style) + " font.");
    if (font->UnitsPerEm() <= 0)
      throw MetricsUnavailable(std::string("The ") + StyleName(style) +
                               " font reports no units per em.");
  }
  for (TextClass textClass : kAllTextClasses) {
    for (Style style : kAllStyles) {
      spaceWidths_[TextClassIndex(textClass)][StyleIndex(style)] =
          Width(" ", style, sizes_.For(textClass));
    }
  }
}

double MetricsAdapter::Width(const std::string &text, Style style,
                             double size) const {
  const FontMetricsProvider &font = Font(style);
  return font.AdvanceUnits(text) / font.UnitsPerEm() * size *
         scalars_.For(style);
}

double MetricsAdapter::Width(const std::string &text, Style style,
                             TextClass textClass) const {
  return Width(text, style, sizes_.For(textClass));
}

double MetricsAdapter::LineHeight(Style style, double size) const {
  const FontMetricsProvider &font = Font(style);
  return static_cast<double>(font.Ascent() - font.Descent()) /
         font.UnitsPerEm() * size * scalars_.For(style);
}

double MetricsAdapter::TextHeight(size_t lines, Style style,
                                  TextClass textClass) const {
  if (lines == 0)
    return 0.0;
  return static_cast<double>(lines - 1) * Newline(textClass) +
         LineHeight(style, FontSize(textClass));
}

double MetricsAdapter::SpaceWidth(Style style, TextClass textClass) const {
  return spaceWidths_[TextClassIndex(textClass)][StyleIndex(style)];
}

} // namespace spellscribe
