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

#include <array>
#include <string>

namespace spellscribe {

enum class Style { Regular, Bold, Italic, BoldItalic };

enum class TextClass { Title, Header, Body, TableTitle, TableBody };

constexpr std::array<Style, 4> kAllStyles = {Style::Regular, Style::Bold,
                                             Style::Italic, Style::BoldItalic};
constexpr std::array<TextClass, 5> kAllTextClasses = {
    TextClass::Title, TextClass::Header, TextClass::Body,
    TextClass::TableTitle, TextClass::TableBody};

constexpr size_t StyleIndex(Style style) { return static_cast<size_t>(style); }
constexpr size_t TextClassIndex(TextClass textClass) {
  return static_cast<size_t>(textClass);
}

// Channels in [0, 1].
struct Color {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;

  static Color FromRgb(int red, int green, int blue) {
    return {red / 255.0, green / 255.0, blue / 255.0};
  }
};

inline bool operator==(const Color &a, const Color &b) {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline const char *StyleName(Style style) {
  switch (style) {
  case Style::Bold:
    return "bold";
  case Style::Italic:
    return "italic";
  case Style::BoldItalic:
    return "bold_italic";
  case Style::Regular:
  default:
    return "regular";
  }
}

inline bool StyleFromName(const std::string &name, Style &out) {
  for (Style style : kAllStyles) {
    if (name == StyleName(style)) {
      out = style;
      return true;
    }
  }
  return false;
}

} // namespace spellscribe
