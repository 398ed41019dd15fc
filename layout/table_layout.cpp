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
#include "table_layout.h"

#include "line_wrapper.h"
#include "stringutils.h"

#include <numeric>

namespace spellscribe {

namespace {

const char *const kTitleTag = "<title>";
const char *const kRowTag = "<row>";
constexpr char kColumnDelimiter = '|';

// Splits one row's tokens into cells at unescaped '|' characters.
TableRow SplitCells(const std::vector<std::string> &tokens) {
  TableRow cells(1);
  for (const auto &token : tokens) {
    if (StringUtils::IsEscaped(token)) {
      cells.back().push_back(token.substr(1));
      continue;
    }
    size_t start = 0;
    while (true) {
      size_t pos = token.find(kColumnDelimiter, start);
      std::string part = token.substr(start, pos == std::string::npos
                                                 ? std::string::npos
                                                 : pos - start);
      if (!part.empty())
        cells.back().push_back(part);
      if (pos == std::string::npos)
        break;
      cells.emplace_back();
      start = pos + 1;
    }
  }
  return cells;
}

bool RowIsEmpty(const TableRow &row) {
  for (const auto &cell : row) {
    if (!cell.empty())
      return false;
  }
  return true;
}

void PadRows(ParsedTable &table) {
  size_t columns = 0;
  for (const auto &row : table.rows)
    columns = std::max(columns, row.size());
  for (auto &row : table.rows)
    row.resize(columns);
}

} // namespace

ParsedTable ParseTableTokens(const std::vector<std::string> &tokens) {
  ParsedTable table;
  size_t i = 0;
  if (!tokens.empty() && tokens.front() == kTitleTag) {
    for (i = 1; i < tokens.size() && tokens[i] != kTitleTag; ++i)
      table.title.push_back(StringUtils::StripLeadingEscape(tokens[i]));
    if (i < tokens.size())
      ++i;
  }

  std::vector<std::vector<std::string>> rawRows(1);
  for (; i < tokens.size(); ++i) {
    if (tokens[i] == kRowTag)
      rawRows.emplace_back();
    else
      rawRows.back().push_back(tokens[i]);
  }

  for (size_t r = 0; r < rawRows.size(); ++r) {
    TableRow row = SplitCells(rawRows[r]);
    if (RowIsEmpty(row))
      continue;
    if (r == 0)
      table.hasHeader = true;
    table.rows.push_back(std::move(row));
  }
  PadRows(table);
  return table;
}

ParsedTable TableFromGrid(const std::string &title,
                          const std::vector<std::string> &columnLabels,
                          const std::vector<std::vector<std::string>> &cells) {
  ParsedTable table;
  table.title = StringUtils::SplitWhitespace(title);
  auto toRow = [](const std::vector<std::string> &values) {
    TableRow row;
    row.reserve(values.size());
    for (const auto &value : values)
      row.push_back(StringUtils::SplitWhitespace(value));
    return row;
  };
  TableRow header = toRow(columnLabels);
  if (!RowIsEmpty(header)) {
    table.hasHeader = true;
    table.rows.push_back(std::move(header));
  }
  for (const auto &values : cells) {
    TableRow row = toRow(values);
    if (!RowIsEmpty(row))
      table.rows.push_back(std::move(row));
  }
  PadRows(table);
  return table;
}

ColumnSolution SolveColumns(const std::vector<double> &maxWidths,
                            double tableWidth, double margin) {
  ColumnSolution solution;
  const size_t count = maxWidths.size();
  if (count == 0)
    return solution;
  solution.columns.resize(count);

  const double available =
      std::max(0.0, tableWidth - margin * static_cast<double>(count - 1));
  double defaultWidth = available / static_cast<double>(count);

  std::vector<size_t> order(count);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return maxWidths[a] < maxWidths[b];
  });

  size_t unfixed = count;
  for (size_t index : order) {
    --unfixed;
    ColumnPlan &column = solution.columns[index];
    if (maxWidths[index] < defaultWidth) {
      column.width = maxWidths[index];
      column.centered = true;
      if (unfixed > 0)
        defaultWidth += (defaultWidth - maxWidths[index]) /
                        static_cast<double>(unfixed);
    } else {
      column.width = defaultWidth;
      column.centered = false;
    }
  }

  double x = 0.0;
  for (size_t c = 0; c < count; ++c) {
    solution.columns[c].x = x;
    x += solution.columns[c].width + margin;
  }
  solution.tableWidth = std::min(tableWidth, x - margin);
  return solution;
}

TableLayoutEngine::TableLayoutEngine(Document &document, TextFlowEngine &flow,
                                     const TableOptions &options,
                                     const TextColors &colors)
    : document_(document), flow_(flow), options_(options), colors_(colors) {}

TablePlan TableLayoutEngine::Plan(const ParsedTable &table,
                                  const FlowRegion &region) const {
  const MetricsAdapter &metrics = document_.Metrics();
  TablePlan plan;
  plan.innerXMin = region.xMin + options_.outerHorizontalMargin;
  plan.innerXMax = region.xMax - options_.outerHorizontalMargin;
  const double nominalWidth = plan.innerXMax - plan.innerXMin;
  if (!(nominalWidth > 0.0))
    return plan;

  const double titleSize = metrics.FontSize(TextClass::TableTitle);
  const double bodySize = metrics.FontSize(TextClass::TableBody);
  plan.titleLines = WrapTokens(table.title, nominalWidth, Style::Bold,
                               titleSize, metrics, EscapeMode::Verbatim);
  plan.titleHeight = metrics.TextHeight(plan.titleLines.size(), Style::Bold,
                                        TextClass::TableTitle);

  const size_t columnCount = table.ColumnCount();
  auto rowStyle = [&](size_t r) {
    return table.hasHeader && r == 0 ? Style::Bold : Style::Regular;
  };

  std::vector<double> maxWidths(columnCount, 0.0);
  for (size_t r = 0; r < table.rows.size(); ++r) {
    for (size_t c = 0; c < columnCount; ++c) {
      const std::string text = StringUtils::Join(table.rows[r][c], " ");
      maxWidths[c] =
          std::max(maxWidths[c], metrics.Width(text, rowStyle(r), bodySize));
    }
  }

  ColumnSolution solution = SolveColumns(
      maxWidths, nominalWidth, options_.horizontalCellMargin);
  const double left =
      plan.innerXMin + (nominalWidth - solution.tableWidth) / 2.0;
  for (auto &column : solution.columns)
    column.x += left;
  plan.columns = std::move(solution.columns);

  double gridHeight = 0.0;
  for (size_t r = 0; r < table.rows.size(); ++r) {
    RowPlan row;
    row.style = rowStyle(r);
    for (size_t c = 0; c < columnCount; ++c) {
      row.cellLines.push_back(WrapTokens(table.rows[r][c],
                                         plan.columns[c].width, row.style,
                                         bodySize, metrics,
                                         EscapeMode::Verbatim));
      row.lineCount = std::max(row.lineCount, row.cellLines.back().size());
    }
    row.height = metrics.TextHeight(row.lineCount, row.style,
                                    TextClass::TableBody);
    gridHeight += row.height;
    if (r > 0)
      gridHeight += options_.verticalCellMargin;
    plan.rows.push_back(std::move(row));
  }

  plan.height = plan.titleHeight + gridHeight;
  if (!plan.titleLines.empty() && !plan.rows.empty())
    plan.height += options_.verticalCellMargin;
  return plan;
}

void TableLayoutEngine::Layout(LayoutContext &context,
                               const ParsedTable &table) {
  const FlowRegion &region = context.region;
  if (region.IsDegenerate())
    return;
  const TablePlan plan = Plan(table, region);
  if (plan.titleLines.empty() && plan.rows.empty())
    return;

  PageCursor cursor(context, document_);
  const double pageHeight = region.Height();
  auto fitsHere = [&](double height) {
    return context.cursor.y - height >= region.yMin;
  };
  if ((!fitsHere(plan.height) && plan.height <= pageHeight) ||
      (!fitsHere(plan.titleHeight) && plan.titleHeight <= pageHeight))
    cursor.NextPage();

  if (!plan.titleLines.empty()) {
    flow_.FlowCentered(context, plan.titleLines, plan.innerXMin,
                       plan.innerXMax, Style::Bold, TextClass::TableTitle);
    if (!plan.rows.empty())
      context.cursor.y -= options_.verticalCellMargin;
  } else {
    cursor.BeginBlock();
  }

  if (!plan.rows.empty()) {
    LayoutSnapshot start = context.Save();
    start.freshBlock = true;
    DrawShading(context, plan);
    context.Restore(start);
    DrawCells(context, plan);
  }
  context.cursor.x = region.xMin;
  context.lineStartX = region.xMin;
  context.hasContent = true;
}

void TableLayoutEngine::DrawShading(LayoutContext &context,
                                    const TablePlan &plan) {
  const MetricsAdapter &metrics = document_.Metrics();
  const double newline = metrics.Newline(TextClass::TableBody);
  const double yAdjust =
      metrics.FontSize(TextClass::TableBody) * options_.offRowYAdjustScalar;
  const double thickness = newline * options_.offRowHeightScalar;
  const ColumnPlan &first = plan.columns.front();
  const ColumnPlan &last = plan.columns.back();
  const double xMin = first.x - options_.outerHorizontalMargin;
  const double xMax = last.x + last.width + options_.outerHorizontalMargin;

  size_t currentRow = 0;
  size_t shadedLines = 0;
  WalkTableLines(context, document_, plan, newline,
                 options_.verticalCellMargin,
                 [&](const TableLineVisit &visit) {
                   if (visit.row != currentRow) {
                     currentRow = visit.row;
                     shadedLines = 0;
                   }
                   // Every second grid row is shaded, one segment per line.
                   if (visit.row % 2 == 0 || visit.line < shadedLines)
                     return;
                   shadedLines = visit.line + 1;
                   document_.Output().DrawLineSegment(
                       visit.page, xMin, visit.y + yAdjust, xMax,
                       visit.y + yAdjust, options_.offRowColor, thickness);
                 });
}

void TableLayoutEngine::DrawCells(LayoutContext &context,
                                  const TablePlan &plan) {
  const MetricsAdapter &metrics = document_.Metrics();
  const double newline = metrics.Newline(TextClass::TableBody);
  const double size = metrics.FontSize(TextClass::TableBody);
  const Color &color = colors_.For(TextClass::TableBody);
  WalkTableLines(
      context, document_, plan, newline, options_.verticalCellMargin,
      [&](const TableLineVisit &visit) {
        const RowPlan &row = plan.rows[visit.row];
        const ColumnPlan &column = plan.columns[visit.column];
        const std::string &line = row.cellLines[visit.column][visit.line];
        double x = column.x;
        if (column.centered)
          x += (column.width - metrics.Width(line, row.style, size)) / 2.0;
        document_.Output().DrawText(visit.page, x, visit.y, line, row.style,
                                    size, color);
      });
}

} // namespace spellscribe
