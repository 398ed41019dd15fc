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
#include "page_cursor.h"
#include "spellbookconfig.h"
#include "text_flow.h"

#include <algorithm>
#include <string>
#include <vector>

namespace spellscribe {

using CellTokens = std::vector<std::string>;
using TableRow = std::vector<CellTokens>;

// A table after token parsing. Tokens are already unescaped. Rows are padded
// to the same column count; when hasHeader is set rows[0] is the header.
struct ParsedTable {
  CellTokens title;
  std::vector<TableRow> rows;
  bool hasHeader = false;

  size_t ColumnCount() const { return rows.empty() ? 0 : rows.front().size(); }
};

// Splits collected table tokens. An optional title is enclosed in a pair of
// <title> tokens at the very start, rows are separated by <row> tokens and
// cells by '|'. Escaped tokens lose one escape character and never act as
// delimiters. The part before the first <row> is the header row.
ParsedTable ParseTableTokens(const std::vector<std::string> &tokens);

// Builds a table from already separated strings.
ParsedTable TableFromGrid(const std::string &title,
                          const std::vector<std::string> &columnLabels,
                          const std::vector<std::vector<std::string>> &cells);

struct ColumnPlan {
  double width = 0.0;
  // Offset from the left edge of the table.
  double x = 0.0;
  bool centered = false;
};

struct ColumnSolution {
  std::vector<ColumnPlan> columns;
  double tableWidth = 0.0;
};

// Distributes `tableWidth` over the columns. Columns whose content is
// narrower than an even share keep their content width and are centered; the
// width they free is handed to the remaining columns. The sum of widths and
// margins never exceeds `tableWidth`.
ColumnSolution SolveColumns(const std::vector<double> &maxWidths,
                            double tableWidth, double margin);

struct RowPlan {
  std::vector<std::vector<std::string>> cellLines;
  Style style = Style::Regular;
  size_t lineCount = 0;
  double height = 0.0;
};

struct TablePlan {
  std::vector<std::string> titleLines;
  std::vector<ColumnPlan> columns;
  std::vector<RowPlan> rows;
  // Extent of the text area the table is centered in.
  double innerXMin = 0.0;
  double innerXMax = 0.0;
  double titleHeight = 0.0;
  double height = 0.0;
};

struct TableLineVisit {
  size_t row = 0;
  size_t column = 0;
  size_t line = 0;
  size_t pageIndex = 0;
  PageHandle page = 0;
  double y = 0.0;
};

// Walks every cell line of the grid in row order, each cell starting from
// the row's first line. Rows end at the lowest point any of their cells
// reached. Replaying from the same context state visits the same lines on the
// same pages, which lets shading and text be drawn in separate passes.
template <typename Visitor>
void WalkTableLines(LayoutContext &context, Document &document,
                    const TablePlan &plan, double newline,
                    double verticalCellMargin, Visitor &&visit) {
  PageCursor cursor(context, document);
  for (size_t r = 0; r < plan.rows.size(); ++r) {
    if (r > 0)
      context.cursor.y -= verticalCellMargin;
    LayoutSnapshot rowStart = context.Save();
    rowStart.freshBlock = true;
    LayoutSnapshot rowEnd = rowStart;
    const RowPlan &row = plan.rows[r];
    for (size_t c = 0; c < row.cellLines.size(); ++c) {
      context.Restore(rowStart);
      for (size_t j = 0; j < row.cellLines[c].size(); ++j) {
        cursor.AdvanceLine(newline);
        visit(TableLineVisit{r, c, j, context.pageIndex, context.CurrentPage(),
                             context.cursor.y});
      }
      if (context.pageIndex > rowEnd.pageIndex) {
        rowEnd = context.Save();
      } else if (context.pageIndex == rowEnd.pageIndex) {
        rowEnd.cursor.y = std::min(rowEnd.cursor.y, context.cursor.y);
      }
    }
    context.Restore(rowEnd);
    context.freshBlock = false;
  }
}

// Lays out tables: column solving, cell wrapping, pagination, then a shading
// pass and a text pass over the same line walk.
class TableLayoutEngine {
public:
  TableLayoutEngine(Document &document, TextFlowEngine &flow,
                    const TableOptions &options, const TextColors &colors);

  TablePlan Plan(const ParsedTable &table, const FlowRegion &region) const;

  // Draws the table with its first line on the current y, moving to a new
  // page first when the table does not fit the rest of this page but would
  // fit an empty one. Leaves the cursor on the last line of the table.
  void Layout(LayoutContext &context, const ParsedTable &table);

private:
  void DrawShading(LayoutContext &context, const TablePlan &plan);
  void DrawCells(LayoutContext &context, const TablePlan &plan);

  Document &document_;
  TextFlowEngine &flow_;
  TableOptions options_;
  const TextColors &colors_;
};

} // namespace spellscribe
