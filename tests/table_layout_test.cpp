#include "document.h"
#include "table_layout.h"
#include "test_support.h"
#include "text_flow.h"

#include <optional>

using namespace testsupport;

namespace {

TableOptions SmallMargins() {
  TableOptions options;
  options.horizontalCellMargin = 2.0;
  options.verticalCellMargin = 8.0;
  options.outerHorizontalMargin = 0.0;
  options.outerVerticalMargin = 0.0;
  options.offRowYAdjustScalar = 0.1;
  options.offRowHeightScalar = 0.5;
  return options;
}

struct Fixture {
  explicit Fixture(double pageHeight)
      : metrics(MakeMetrics(10.0, 5.0)),
        document(renderer, metrics, MakePage(210.0, pageHeight, 10.0),
                 std::nullopt),
        flow(document, colors), tables(document, flow, SmallMargins(), colors) {
  }

  LayoutContext Start(double y) {
    PageHandle page = document.NewPage();
    const FlowRegion region = document.TextRegion();
    return LayoutContext(region, {region.xMin, y}, page);
  }

  MetricsAdapter metrics;
  RecordingRenderer renderer;
  TextColors colors;
  Document document;
  TextFlowEngine flow;
  TableLayoutEngine tables;
};

ParsedTable Grid(size_t bodyRows) {
  std::vector<std::vector<std::string>> cells;
  for (size_t r = 0; r < bodyRows; ++r)
    cells.push_back({"r" + std::to_string(r), "x"});
  return TableFromGrid("", {"h1", "h2"}, cells);
}

void ExpectShadingMatchesText(const RecordingRenderer &renderer,
                              const std::string &label) {
  for (const DrawnLine &line : renderer.lines) {
    bool matched = false;
    for (const DrawnText &text : renderer.texts) {
      if (text.page == line.page && Near(text.y + 1.0, line.y1))
        matched = true;
    }
    Expect(matched, label + ": shading at y " + std::to_string(line.y1) +
                        " has text on the same page");
  }
}

} // namespace

int main() {
  // Column solver.
  {
    ColumnSolution solution = SolveColumns({10.0, 80.0, 10.0}, 96.0, 2.0);
    Expect(solution.columns.size() == 3, "one plan per column");
    Expect(Near(solution.columns[0].width, 10.0) &&
               Near(solution.columns[1].width, 72.0) &&
               Near(solution.columns[2].width, 10.0),
           "narrow columns hand their space to the wide one");
    Expect(solution.columns[0].centered && solution.columns[2].centered,
           "narrow columns are centered");
    Expect(Near(solution.columns[1].x, 12.0) &&
               Near(solution.columns[2].x, 86.0),
           "columns are laid out left to right with margins");
    Expect(Near(solution.tableWidth, 96.0), "table spans the width");

    ColumnSolution narrow = SolveColumns({5.0, 5.0}, 190.0, 2.0);
    Expect(Near(narrow.columns[0].width, 5.0) &&
               Near(narrow.columns[1].width, 5.0),
           "narrow columns keep their content width");
    Expect(Near(narrow.tableWidth, 12.0), "table shrinks to its columns");

    ColumnSolution wide = SolveColumns({100.0, 100.0, 100.0}, 190.0, 2.0);
    for (const ColumnPlan &column : wide.columns)
      Expect(Near(column.width, 62.0) && !column.centered,
             "over-wide columns share the width evenly");

    const std::vector<std::vector<double>> cases = {
        {1.0, 2.0, 300.0, 4.0}, {50.0, 60.0, 70.0}, {0.0}, {20.0, 200.0}};
    for (const auto &widths : cases) {
      ColumnSolution result = SolveColumns(widths, 150.0, 3.0);
      double total = 3.0 * static_cast<double>(widths.size() - 1);
      for (size_t c = 0; c < widths.size(); ++c) {
        total += result.columns[c].width;
        if (result.columns[c].centered)
          Expect(Near(result.columns[c].width, widths[c]),
                 "centered columns have their content width");
      }
      Expect(total <= 150.0 + 1e-9, "widths and margins fit the table");
    }
    Expect(SolveColumns({}, 100.0, 2.0).columns.empty(), "no columns");
  }

  // Token parsing.
  {
    ParsedTable table = ParseTableTokens(
        {"<title>", "Big", "\\<row>", "Title", "<title>", "h1", "|", "h2",
         "<row>", "a", "|", "b", "\\|", "c", "<row>", "<row>", "d|e|f"});
    Expect(table.title == std::vector<std::string>{"Big", "<row>", "Title"},
           "title tokens are unescaped");
    Expect(table.hasHeader, "tokens before the first row form a header");
    Expect(table.rows.size() == 3, "empty rows are dropped");
    Expect(table.ColumnCount() == 3, "rows are padded to the widest");
    if (table.rows.size() == 3) {
      Expect(table.rows[1][1] == std::vector<std::string>{"b", "|", "c"},
             "an escaped delimiter is cell text");
      Expect(table.rows[1][2].empty(), "short rows get empty cells");
      Expect(table.rows[2][0] == std::vector<std::string>{"d"} &&
                 table.rows[2][2] == std::vector<std::string>{"f"},
             "delimiters inside a token split it");
    }

    ParsedTable headless = ParseTableTokens({"<row>", "a", "|", "b"});
    Expect(!headless.hasHeader && headless.rows.size() == 1,
           "an empty header part means no header");
    Expect(ParseTableTokens({}).rows.empty(), "no tokens, no rows");
  }

  // Planning.
  {
    Fixture f(297.0);
    ParsedTable table = TableFromGrid("Wild Magic", {"d4", "Effect"},
                                      {{"1", "abcdefghij abcdefghij"}});
    TablePlan plan = f.tables.Plan(table, {10.0, 60.0, 10.0, 287.0});
    Expect(plan.titleLines.size() == 1, "title fits on one line");
    Expect(plan.columns.size() == 2, "two columns");
    Expect(plan.rows.size() == 2 && plan.rows[0].style == Style::Bold &&
               plan.rows[1].style == Style::Regular,
           "header row is bold");
    if (plan.rows.size() == 2) {
      Expect(plan.rows[1].lineCount == 2, "long cell wraps in its column");
      Expect(Near(plan.rows[1].height, 15.0), "row height from line count");
    }
    Expect(Near(plan.height, 10.0 + 8.0 + 10.0 + 8.0 + 15.0),
           "title, margins and rows add up");
  }

  // Shading and text from the same walk.
  {
    Fixture f(297.0);
    LayoutContext context = f.Start(287.0);
    f.tables.Layout(context, Grid(3));
    Expect(f.renderer.texts.size() == 8, "every cell drawn once");
    Expect(f.renderer.lines.size() == 2, "first and third body rows shaded");
    ExpectShadingMatchesText(f.renderer, "single page");
    const DrawnText *header = f.renderer.FindText("h1");
    const DrawnText *row0 = f.renderer.FindText("r0");
    Expect(header && Near(header->y, 287.0), "header on the starting line");
    Expect(row0 && Near(row0->y, 279.0), "rows are a cell margin apart");
    if (!f.renderer.lines.empty()) {
      const DrawnLine &line = f.renderer.lines.front();
      Expect(Near(line.thickness, 2.5), "thickness follows the newline");
      Expect(line.color == SmallMargins().offRowColor, "off-row color");
    }
  }

  // Rows split across pages keep shading aligned.
  {
    Fixture f(60.0);
    LayoutContext context = f.Start(50.0);
    f.tables.Layout(context, Grid(5));
    const DrawnText *last = f.renderer.FindText("r4");
    Expect(last && last->page == 1 && Near(last->y, 50.0),
           "the row reaching the bottom moves to the next page");
    Expect(f.renderer.lines.size() == 3, "three shaded rows");
    ExpectShadingMatchesText(f.renderer, "split table");
    Expect(f.document.PageCount() == 2, "both passes share the new page");
  }

  // A table that fits on a fresh page is moved there whole.
  {
    Fixture f(60.0);
    LayoutContext context = f.Start(25.0);
    f.tables.Layout(context, Grid(1));
    const DrawnText *header = f.renderer.FindText("h1");
    Expect(header && header->page == 1 && Near(header->y, 50.0),
           "table starts on the next page");
  }

  // Title is centered over the grid.
  {
    Fixture f(297.0);
    LayoutContext context = f.Start(287.0);
    f.tables.Layout(context, TableFromGrid("ab", {}, {{"x"}}));
    const DrawnText *title = f.renderer.FindText("ab");
    Expect(title && title->style == Style::Bold && Near(title->x, 100.0) &&
               Near(title->y, 287.0),
           "title centered in the region");
    const DrawnText *cell = f.renderer.FindText("x");
    Expect(cell && Near(cell->y, 279.0), "grid one cell margin below");
    Expect(Near(context.cursor.x, 10.0), "cursor returns to the margin");
  }

  return FailureCount() ? 1 : 0;
}
