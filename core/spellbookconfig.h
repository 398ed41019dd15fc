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

#include "typography.h"

#include <filesystem>
#include <optional>
#include <string>

namespace spellscribe {

// Points to millimetres. Font sizes are points, everything else on the page is
// millimetres.
constexpr double kPtToMm = 25.4 / 72.0;
constexpr double kMmToPt = 72.0 / 25.4;

struct FontPaths {
  std::string regular;
  std::string bold;
  std::string italic;
  std::string boldItalic;

  const std::string &For(Style style) const;
  void Validate() const;
};

struct FontSizes {
  double title = 32.0;
  double header = 24.0;
  double body = 12.0;
  double tableTitle = 16.0;
  double tableBody = 12.0;

  double For(TextClass textClass) const;
  void Validate() const;
};

// Converts font units at a given point size into page millimetres. The plain
// point to millimetre ratio reproduces the font's own metrics; fonts whose
// outlines run large or small can be nudged per style.
struct FontScalars {
  double regular = kPtToMm;
  double bold = kPtToMm;
  double italic = kPtToMm;
  double boldItalic = kPtToMm;

  double For(Style style) const;
  void Validate() const;
};

struct SpacingOptions {
  double tabAmount = 7.5;
  double titleNewline = 12.0;
  double headerNewline = 8.0;
  double bodyNewline = 5.0;
  double tableTitleNewline = 6.4;
  double tableBodyNewline = 5.0;

  double NewlineFor(TextClass textClass) const;
  void Validate() const;
};

struct TextColors {
  Color title{};
  Color header = Color::FromRgb(115, 26, 26);
  Color body{};
  Color tableTitle{};
  Color tableBody{};

  const Color &For(TextClass textClass) const;
};

struct PageSizeOptions {
  double width = 210.0;
  double height = 297.0;
  double leftMargin = 10.0;
  double rightMargin = 10.0;
  double topMargin = 10.0;
  double bottomMargin = 10.0;

  void Validate() const;
};

enum class PageSide { Left, Right };

struct PageNumberOptions {
  PageSide startingSide = PageSide::Left;
  bool flipsSides = false;
  int startingNumber = 1;
  Style style = Style::Regular;
  double fontSize = 12.0;
  Color color{};
  double sideMargin = 5.0;
  double bottomMargin = 4.0;

  void Validate() const;
};

// JPEG drawn on every page. Position and size are in millimetres from the
// bottom-left corner; a non-positive size stretches to the page.
struct BackgroundOptions {
  std::string imagePath;
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  void Validate() const;
};

struct TableOptions {
  double horizontalCellMargin = 10.0;
  double verticalCellMargin = 8.0;
  double outerHorizontalMargin = 4.0;
  double outerVerticalMargin = 12.0;
  // Shading line offset above the baseline, multiplied by the font size.
  double offRowYAdjustScalar = 0.1075;
  // Shading line thickness, multiplied by the newline amount.
  double offRowHeightScalar = 4.0 * kPtToMm;
  Color offRowColor = Color::FromRgb(213, 209, 224);

  void Validate() const;
};

// Immutable, fully validated settings for one spellbook. Every constructor
// path runs the same validation and throws ConfigurationError.
class SpellbookConfig {
public:
  SpellbookConfig(FontPaths fonts, FontSizes sizes, FontScalars scalars,
                  SpacingOptions spacing, TextColors colors,
                  PageSizeOptions page,
                  std::optional<PageNumberOptions> pageNumbers,
                  std::optional<BackgroundOptions> background,
                  TableOptions table);

  // Default sizes and spacing with the given fonts.
  static SpellbookConfig WithDefaults(const FontPaths &fonts);

  const FontPaths &Fonts() const { return fonts_; }
  const FontSizes &Sizes() const { return sizes_; }
  const FontScalars &Scalars() const { return scalars_; }
  const SpacingOptions &Spacing() const { return spacing_; }
  const TextColors &Colors() const { return colors_; }
  const PageSizeOptions &Page() const { return page_; }
  const std::optional<PageNumberOptions> &PageNumbers() const {
    return pageNumbers_;
  }
  const std::optional<BackgroundOptions> &Background() const {
    return background_;
  }
  const TableOptions &Table() const { return table_; }

private:
  FontPaths fonts_;
  FontSizes sizes_;
  FontScalars scalars_;
  SpacingOptions spacing_;
  TextColors colors_;
  PageSizeOptions page_;
  std::optional<PageNumberOptions> pageNumbers_;
  std::optional<BackgroundOptions> background_;
  TableOptions table_;
};

// Reads a JSON configuration file. Absent keys keep their defaults; relative
// font and image paths resolve against the file's directory.
SpellbookConfig LoadSpellbookConfig(const std::filesystem::path &path);
SpellbookConfig ParseSpellbookConfig(const std::string &jsonText,
                                     const std::filesystem::path &baseDir = {});

} // namespace spellscribe
