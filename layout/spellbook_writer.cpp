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
#include "spellbook_writer.h"

#include "line_wrapper.h"

#include <vector>

namespace spellscribe {

namespace {
const char *const kDefaultTitle = "Spellbook";
const char *const kTitleBookmark = "Title Page";
} // namespace

SpellbookWriter::SpellbookWriter(Document &document,
                                 const SpellbookConfig &config)
    : document_(document),
      flow_(document, config.Colors()),
      tables_(document, flow_, config.Table(), config.Colors()),
      markup_(document, flow_, tables_, config.Table()) {}

void SpellbookWriter::WriteTitlePage(const std::string &title) {
  const std::string text = title.empty() ? kDefaultTitle : title;
  PageHandle page = document_.NewPage(false);
  document_.Output().AddBookmark(kTitleBookmark, page);

  const FlowRegion region = document_.TextRegion();
  if (region.IsDegenerate())
    return;
  const MetricsAdapter &metrics = document_.Metrics();
  const double size = metrics.FontSize(TextClass::Title);
  std::vector<std::string> lines = WrapText(
      text, region.Width(), Style::Regular, size, metrics);

  // First baseline so the block is centered vertically.
  const double height =
      metrics.TextHeight(lines.size(), Style::Regular, TextClass::Title);
  const double top = (region.yMin + region.yMax + height) / 2.0;
  Cursor start{region.xMin, top - metrics.LineHeight(Style::Regular, size)};
  LayoutContext context(region, start, page);
  flow_.FlowCentered(context, lines, region.xMin, region.xMax, Style::Regular,
                     TextClass::Title);
}

LayoutContext SpellbookWriter::NextField(const LayoutContext &previous,
                                         double advance) const {
  Cursor start{previous.region.xMin, previous.cursor.y - advance};
  return LayoutContext(previous.region, start, previous.CurrentPage());
}

void SpellbookWriter::WriteLabeled(LayoutContext &context,
                                   const std::string &label,
                                   const std::string &value) {
  markup_.Write(context, "<b> " + label + " <r> " + value, Style::Regular,
                TextClass::Body);
}

void SpellbookWriter::WriteSpell(const Spell &spell) {
  PageHandle page = document_.NewPage();
  document_.Output().AddBookmark(spell.name, page);

  const FlowRegion region = document_.TextRegion();
  const MetricsAdapter &metrics = document_.Metrics();
  const double headerNewline = metrics.Newline(TextClass::Header);
  const double bodyNewline = metrics.Newline(TextClass::Body);

  LayoutContext name(region, {region.xMin, region.yMax}, page);
  flow_.Flow(name, spell.name, Style::Regular, TextClass::Header);

  LayoutContext levelSchool = NextField(name, headerNewline);
  flow_.Flow(levelSchool, spell.LevelSchoolText(), Style::Italic,
             TextClass::Body);

  LayoutContext castingTime = NextField(levelSchool, headerNewline);
  WriteLabeled(castingTime, "Casting Time:", spell.castingTime.Text());

  LayoutContext range = NextField(castingTime, bodyNewline);
  WriteLabeled(range, "Range:", spell.range.Text());

  LayoutContext components = NextField(range, bodyNewline);
  WriteLabeled(components, "Components:", spell.ComponentsText());

  LayoutContext duration = NextField(components, bodyNewline);
  WriteLabeled(duration, "Duration:", spell.duration.Text());

  std::vector<ParsedTable> tables;
  tables.reserve(spell.tables.size());
  for (const SpellTable &table : spell.tables)
    tables.push_back(
        TableFromGrid(table.title, table.columnLabels, table.cells));

  LayoutContext description = NextField(duration, headerNewline);
  markup_.Write(description, spell.FullDescription(), Style::Regular,
                TextClass::Body, tables);
}

} // namespace spellscribe
