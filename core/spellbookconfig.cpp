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
#include "spellbookconfig.h"

#include "errors.h"

#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace spellscribe {

namespace {

using json = nlohmann::json;

void RequireNonNegative(double value, const char *message) {
  if (!(value >= 0.0))
    throw ConfigurationError(message);
}

const json *FindSection(const json &root, const char *key) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null())
    return nullptr;
  if (!it->is_object())
    throw ConfigurationError(std::string("Invalid ") + key +
                             ": expected an object.");
  return &*it;
}

void ReadNumber(const json &section, const char *sectionName, const char *key,
                double &out) {
  auto it = section.find(key);
  if (it == section.end())
    return;
  if (!it->is_number())
    throw ConfigurationError(std::string("Invalid ") + sectionName + "." +
                             key + ": expected a number.");
  out = it->get<double>();
}

void ReadInt(const json &section, const char *sectionName, const char *key,
             int &out) {
  auto it = section.find(key);
  if (it == section.end())
    return;
  if (!it->is_number_integer())
    throw ConfigurationError(std::string("Invalid ") + sectionName + "." +
                             key + ": expected an integer.");
  out = it->get<int>();
}

void ReadBool(const json &section, const char *sectionName, const char *key,
              bool &out) {
  auto it = section.find(key);
  if (it == section.end())
    return;
  if (!it->is_boolean())
    throw ConfigurationError(std::string("Invalid ") + sectionName + "." +
                             key + ": expected true or false.");
  out = it->get<bool>();
}

void ReadPath(const json &section, const char *sectionName, const char *key,
              const std::filesystem::path &baseDir, std::string &out) {
  auto it = section.find(key);
  if (it == section.end())
    return;
  if (!it->is_string())
    throw ConfigurationError(std::string("Invalid ") + sectionName + "." +
                             key + ": expected a path.");
  std::filesystem::path path = it->get<std::string>();
  if (path.is_relative() && !baseDir.empty())
    path = baseDir / path;
  out = path.string();
}

void ReadColor(const json &section, const char *sectionName, const char *key,
               Color &out) {
  auto it = section.find(key);
  if (it == section.end())
    return;
  bool valid = it->is_array() && it->size() == 3;
  if (valid) {
    for (const auto &channel : *it) {
      if (!channel.is_number_integer() || channel.get<int>() < 0 ||
          channel.get<int>() > 255)
        valid = false;
    }
  }
  if (!valid)
    throw ConfigurationError(std::string("Invalid ") + sectionName + "." +
                             key + ": expected [r, g, b] with 0-255 values.");
  out = Color::FromRgb((*it)[0].get<int>(), (*it)[1].get<int>(),
                       (*it)[2].get<int>());
}

void ReadStyle(const json &section, const char *sectionName, const char *key,
               Style &out) {
  auto it = section.find(key);
  if (it == section.end())
    return;
  if (!it->is_string() || !StyleFromName(it->get<std::string>(), out))
    throw ConfigurationError(
        std::string("Invalid ") + sectionName + "." + key +
        ": expected regular, bold, italic or bold_italic.");
}

} // namespace

const std::string &FontPaths::For(Style style) const {
  switch (style) {
  case Style::Bold:
    return bold;
  case Style::Italic:
    return italic;
  case Style::BoldItalic:
    return boldItalic;
  case Style::Regular:
  default:
    return regular;
  }
}

void FontPaths::Validate() const {
  for (Style style : kAllStyles) {
    if (For(style).empty())
      throw ConfigurationError(std::string("Missing ") + StyleName(style) +
                               " font path.");
  }
}

double FontSizes::For(TextClass textClass) const {
  switch (textClass) {
  case TextClass::Title:
    return title;
  case TextClass::Header:
    return header;
  case TextClass::TableTitle:
    return tableTitle;
  case TextClass::TableBody:
    return tableBody;
  case TextClass::Body:
  default:
    return body;
  }
}

void FontSizes::Validate() const {
  RequireNonNegative(title, "Invalid title_font_size.");
  RequireNonNegative(header, "Invalid header_font_size.");
  RequireNonNegative(body, "Invalid body_font_size.");
  RequireNonNegative(tableTitle, "Invalid table_title_font_size.");
  RequireNonNegative(tableBody, "Invalid table_body_font_size.");
}

double FontScalars::For(Style style) const {
  switch (style) {
  case Style::Bold:
    return bold;
  case Style::Italic:
    return italic;
  case Style::BoldItalic:
    return boldItalic;
  case Style::Regular:
  default:
    return regular;
  }
}

void FontScalars::Validate() const {
  RequireNonNegative(regular, "Invalid regular scalar.");
  RequireNonNegative(bold, "Invalid bold scalar.");
  RequireNonNegative(italic, "Invalid italic scalar.");
  RequireNonNegative(boldItalic, "Invalid bold_italic scalar.");
}

double SpacingOptions::NewlineFor(TextClass textClass) const {
  switch (textClass) {
  case TextClass::Title:
    return titleNewline;
  case TextClass::Header:
    return headerNewline;
  case TextClass::TableTitle:
    return tableTitleNewline;
  case TextClass::TableBody:
    return tableBodyNewline;
  case TextClass::Body:
  default:
    return bodyNewline;
  }
}

void SpacingOptions::Validate() const {
  RequireNonNegative(tabAmount, "Invalid tab_amount.");
  RequireNonNegative(titleNewline, "Invalid title_newline_amount.");
  RequireNonNegative(headerNewline, "Invalid header_newline_amount.");
  RequireNonNegative(bodyNewline, "Invalid body_newline_amount.");
  RequireNonNegative(tableTitleNewline, "Invalid table_title_newline_amount.");
  RequireNonNegative(tableBodyNewline, "Invalid table_body_newline_amount.");
}

const Color &TextColors::For(TextClass textClass) const {
  switch (textClass) {
  case TextClass::Title:
    return title;
  case TextClass::Header:
    return header;
  case TextClass::TableTitle:
    return tableTitle;
  case TextClass::TableBody:
    return tableBody;
  case TextClass::Body:
  default:
    return body;
  }
}

void PageSizeOptions::Validate() const {
  if (!(width > 0.0))
    throw ConfigurationError("Invalid page width.");
  if (!(height > 0.0))
    throw ConfigurationError("Invalid page height.");
  if (!(leftMargin > 0.0) || !(rightMargin > 0.0) ||
      leftMargin + rightMargin >= width)
    throw ConfigurationError("Invalid horizontal page margin.");
  if (!(topMargin > 0.0) || !(bottomMargin > 0.0) ||
      topMargin + bottomMargin >= height)
    throw ConfigurationError("Invalid vertical page margin.");
}

void PageNumberOptions::Validate() const {
  RequireNonNegative(fontSize, "Invalid font size.");
  RequireNonNegative(sideMargin, "Invalid side margin.");
  RequireNonNegative(bottomMargin, "Invalid bottom margin.");
}

void BackgroundOptions::Validate() const {
  if (imagePath.empty())
    throw ConfigurationError("Missing background image path.");
}

void TableOptions::Validate() const {
  RequireNonNegative(horizontalCellMargin, "Invalid horizontal_cell_margin.");
  RequireNonNegative(verticalCellMargin, "Invalid vertical_cell_margin.");
  RequireNonNegative(outerHorizontalMargin, "Invalid outer_horizontal_margin.");
  RequireNonNegative(outerVerticalMargin, "Invalid outer_vertical_margin.");
  RequireNonNegative(offRowYAdjustScalar,
                     "Invalid off_row_color_lines_y_adjust_scalar.");
  RequireNonNegative(offRowHeightScalar,
                     "Invalid off_row_color_lines_height_scalar.");
}

SpellbookConfig::SpellbookConfig(FontPaths fonts, FontSizes sizes,
                                 FontScalars scalars, SpacingOptions spacing,
                                 TextColors colors, PageSizeOptions page,
                                 std::optional<PageNumberOptions> pageNumbers,
                                 std::optional<BackgroundOptions> background,
                                 TableOptions table)
    : fonts_(std::move(fonts)), sizes_(sizes), scalars_(scalars),
      spacing_(spacing), colors_(colors), page_(page),
      pageNumbers_(std::move(pageNumbers)),
      background_(std::move(background)), table_(table) {
  fonts_.Validate();
  sizes_.Validate();
  scalars_.Validate();
  spacing_.Validate();
  page_.Validate();
  if (pageNumbers_)
    pageNumbers_->Validate();
  if (background_)
    background_->Validate();
  table_.Validate();
  const double interior = page_.width - page_.leftMargin - page_.rightMargin;
  if (2.0 * table_.outerHorizontalMargin >= interior)
    throw ConfigurationError(
        "Invalid outer_horizontal_margin: wider than the text area.");
}

SpellbookConfig SpellbookConfig::WithDefaults(const FontPaths &fonts) {
  return SpellbookConfig(fonts, FontSizes{}, FontScalars{}, SpacingOptions{},
                         TextColors{}, PageSizeOptions{}, PageNumberOptions{},
                         std::nullopt, TableOptions{});
}

SpellbookConfig ParseSpellbookConfig(const std::string &jsonText,
                                     const std::filesystem::path &baseDir) {
  json root;
  try {
    root = json::parse(jsonText);
  } catch (const json::parse_error &ex) {
    throw ConfigurationError(std::string("Malformed configuration: ") +
                             ex.what());
  }
  if (!root.is_object())
    throw ConfigurationError("Malformed configuration: expected an object.");

  FontPaths fonts;
  if (const json *section = FindSection(root, "fonts")) {
    ReadPath(*section, "fonts", "regular", baseDir, fonts.regular);
    ReadPath(*section, "fonts", "bold", baseDir, fonts.bold);
    ReadPath(*section, "fonts", "italic", baseDir, fonts.italic);
    ReadPath(*section, "fonts", "bold_italic", baseDir, fonts.boldItalic);
  }

  FontSizes sizes;
  if (const json *section = FindSection(root, "font_sizes")) {
    ReadNumber(*section, "font_sizes", "title", sizes.title);
    ReadNumber(*section, "font_sizes", "header", sizes.header);
    ReadNumber(*section, "font_sizes", "body", sizes.body);
    ReadNumber(*section, "font_sizes", "table_title", sizes.tableTitle);
    ReadNumber(*section, "font_sizes", "table_body", sizes.tableBody);
  }

  FontScalars scalars;
  if (const json *section = FindSection(root, "font_scalars")) {
    ReadNumber(*section, "font_scalars", "regular", scalars.regular);
    ReadNumber(*section, "font_scalars", "bold", scalars.bold);
    ReadNumber(*section, "font_scalars", "italic", scalars.italic);
    ReadNumber(*section, "font_scalars", "bold_italic", scalars.boldItalic);
  }

  SpacingOptions spacing;
  if (const json *section = FindSection(root, "spacing")) {
    ReadNumber(*section, "spacing", "tab_amount", spacing.tabAmount);
    ReadNumber(*section, "spacing", "title_newline", spacing.titleNewline);
    ReadNumber(*section, "spacing", "header_newline", spacing.headerNewline);
    ReadNumber(*section, "spacing", "body_newline", spacing.bodyNewline);
    ReadNumber(*section, "spacing", "table_title_newline",
               spacing.tableTitleNewline);
    ReadNumber(*section, "spacing", "table_body_newline",
               spacing.tableBodyNewline);
  }

  TextColors colors;
  if (const json *section = FindSection(root, "colors")) {
    ReadColor(*section, "colors", "title", colors.title);
    ReadColor(*section, "colors", "header", colors.header);
    ReadColor(*section, "colors", "body", colors.body);
    ReadColor(*section, "colors", "table_title", colors.tableTitle);
    ReadColor(*section, "colors", "table_body", colors.tableBody);
  }

  PageSizeOptions page;
  if (const json *section = FindSection(root, "page")) {
    ReadNumber(*section, "page", "width", page.width);
    ReadNumber(*section, "page", "height", page.height);
    ReadNumber(*section, "page", "left_margin", page.leftMargin);
    ReadNumber(*section, "page", "right_margin", page.rightMargin);
    ReadNumber(*section, "page", "top_margin", page.topMargin);
    ReadNumber(*section, "page", "bottom_margin", page.bottomMargin);
  }

  // Page numbers are on unless the key is explicitly false or null.
  std::optional<PageNumberOptions> pageNumbers = PageNumberOptions{};
  auto pageNumbersIt = root.find("page_numbers");
  if (pageNumbersIt != root.end() &&
      (pageNumbersIt->is_null() ||
       (pageNumbersIt->is_boolean() && !pageNumbersIt->get<bool>()))) {
    pageNumbers.reset();
  } else if (pageNumbersIt != root.end() && pageNumbersIt->is_boolean()) {
    // true keeps the defaults
  } else if (const json *section = FindSection(root, "page_numbers")) {
    auto sideIt = section->find("starting_side");
    if (sideIt != section->end()) {
      const std::string side = sideIt->is_string() ? sideIt->get<std::string>()
                                                   : std::string{};
      if (side == "left")
        pageNumbers->startingSide = PageSide::Left;
      else if (side == "right")
        pageNumbers->startingSide = PageSide::Right;
      else
        throw ConfigurationError(
            "Invalid page_numbers.starting_side: expected left or right.");
    }
    ReadBool(*section, "page_numbers", "flips_sides", pageNumbers->flipsSides);
    ReadInt(*section, "page_numbers", "starting_number",
            pageNumbers->startingNumber);
    ReadStyle(*section, "page_numbers", "style", pageNumbers->style);
    ReadNumber(*section, "page_numbers", "font_size", pageNumbers->fontSize);
    ReadColor(*section, "page_numbers", "color", pageNumbers->color);
    ReadNumber(*section, "page_numbers", "side_margin",
               pageNumbers->sideMargin);
    ReadNumber(*section, "page_numbers", "bottom_margin",
               pageNumbers->bottomMargin);
  }

  std::optional<BackgroundOptions> background;
  if (const json *section = FindSection(root, "background")) {
    background.emplace();
    ReadPath(*section, "background", "image", baseDir, background->imagePath);
    ReadNumber(*section, "background", "x", background->x);
    ReadNumber(*section, "background", "y", background->y);
    ReadNumber(*section, "background", "width", background->width);
    ReadNumber(*section, "background", "height", background->height);
  }

  TableOptions table;
  if (const json *section = FindSection(root, "table")) {
    ReadNumber(*section, "table", "horizontal_cell_margin",
               table.horizontalCellMargin);
    ReadNumber(*section, "table", "vertical_cell_margin",
               table.verticalCellMargin);
    ReadNumber(*section, "table", "outer_horizontal_margin",
               table.outerHorizontalMargin);
    ReadNumber(*section, "table", "outer_vertical_margin",
               table.outerVerticalMargin);
    ReadNumber(*section, "table", "off_row_y_adjust_scalar",
               table.offRowYAdjustScalar);
    ReadNumber(*section, "table", "off_row_height_scalar",
               table.offRowHeightScalar);
    ReadColor(*section, "table", "off_row_color", table.offRowColor);
  }

  return SpellbookConfig(std::move(fonts), sizes, scalars, spacing, colors,
                         page, std::move(pageNumbers), std::move(background),
                         table);
}

SpellbookConfig LoadSpellbookConfig(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    throw ConfigurationError("Unable to open configuration file " +
                             path.string() + ".");
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return ParseSpellbookConfig(buffer.str(), path.parent_path());
}

} // namespace spellscribe
