#include "document.h"
#include "markup.h"
#include "table_layout.h"
#include "test_support.h"
#include "text_flow.h"

#include <optional>

using namespace testsupport;

namespace {

TableOptions Options() {
  TableOptions options;
  options.horizontalCellMargin = 2.0;
  options.verticalCellMargin = 8.0;
  options.outerHorizontalMargin = 0.0;
  options.outerVerticalMargin = 3.0;
  return options;
}

struct Fixture {
  Fixture()
      : metrics(MakeMetrics(10.0, 5.0)),
        document(renderer, metrics, MakePage(210.0, 297.0, 10.0),
                 std::nullopt),
        flow(document, colors), tables(document, flow, Options(), colors),
        writer(document, flow, tables, Options()) {}

  LayoutContext Start() {
    PageHandle page = document.NewPage();
    return LayoutContext(document.TextRegion(), {10.0, 287.0}, page);
  }

  MetricsAdapter metrics;
  RecordingRenderer renderer;
  TextColors colors;
  Document document;
  TextFlowEngine flow;
  TableLayoutEngine tables;
  MarkupWriter writer;
};

template <typename T> bool Is(const MarkupToken &token) {
  return std::holds_alternative<T>(token);
}

} // namespace

int main() {
  // Tokenizer.
  {
    auto tokens = TokenizeMarkup("a <b> b\nc <bi> <ib> <i> <r>");
    Expect(tokens.size() == 9, "nine tokens");
    if (tokens.size() == 9) {
      Expect(Is<markup::Plain>(tokens[0]), "plain word");
      Expect(Is<markup::StyleChange>(tokens[1]) &&
                 std::get<markup::StyleChange>(tokens[1]).style == Style::Bold,
             "bold tag");
      Expect(Is<markup::ParagraphEnd>(tokens[3]), "paragraph boundary");
      Expect(std::get<markup::StyleChange>(tokens[6]).style ==
                 Style::BoldItalic,
             "<ib> is bold italic");
      Expect(std::get<markup::StyleChange>(tokens[8]).style == Style::Regular,
             "<r> is regular");
    }

    auto escaped = TokenizeMarkup("\\<r> \\[table][0] <table> <B>");
    Expect(escaped.size() == 4 && Is<markup::Escaped>(escaped[0]) &&
               Is<markup::Escaped>(escaped[1]) &&
               Is<markup::TableToggle>(escaped[2]) &&
               Is<markup::Plain>(escaped[3]),
           "escapes, table toggle and unknown tags");

    Expect(Is<markup::Plain>(TokenizeMarkup("[table][0]", 0)[0]),
           "out of range table reference is text");
    Expect(Is<markup::TableReference>(TokenizeMarkup("[table][0]", 1)[0]),
           "table reference at the start of a paragraph");
    auto inner = TokenizeMarkup("see [table][0]", 1);
    Expect(Is<markup::Plain>(inner[1]),
           "table reference mid paragraph is text");
  }

  // Style switches continue on the same line with a space between.
  {
    Fixture f;
    LayoutContext context = f.Start();
    f.writer.Write(context, "plain <b> bold <r> tail", Style::Regular,
                   TextClass::Body);
    const DrawnText *plain = f.renderer.FindText("plain");
    const DrawnText *bold = f.renderer.FindText("bold");
    const DrawnText *tail = f.renderer.FindText("tail");
    Expect(plain && Near(plain->x, 10.0) && plain->style == Style::Regular,
           "text before the tag");
    Expect(bold && Near(bold->x, 40.0) && Near(bold->y, 287.0) &&
               bold->style == Style::Bold,
           "bold run after one space");
    Expect(tail && Near(tail->x, 65.0) && tail->style == Style::Regular,
           "back to regular");
  }

  // Escaped tags are literal text.
  {
    Fixture f;
    LayoutContext context = f.Start();
    f.writer.Write(context, "\\<r> literal", Style::Regular, TextClass::Body);
    Expect(f.renderer.texts.size() == 1 &&
               f.renderer.texts[0].text == "<r> literal",
           "escaped tag renders as <r>");
  }

  // A tag at the start of a paragraph.
  {
    Fixture f;
    LayoutContext context = f.Start();
    f.writer.Write(context, "one\n<i> two", Style::Regular, TextClass::Body);
    const DrawnText *two = f.renderer.FindText("two");
    Expect(two && two->style == Style::Italic && Near(two->x, 17.5) &&
               Near(two->y, 282.0),
           "new paragraph is indented on the next line");
  }

  // A description that opens with a bullet list.
  {
    Fixture f;
    LayoutContext context = f.Start();
    f.writer.Write(context, "- first\n- second", Style::Regular,
                   TextClass::Body);
    const DrawnText *bullet = f.renderer.FindText("\xE2\x80\xA2 ");
    const DrawnText *first = f.renderer.FindText("first");
    const DrawnText *second = f.renderer.FindText("second");
    Expect(bullet && Near(bullet->x, 10.0) && Near(bullet->y, 287.0),
           "leading bullet drawn at the margin");
    Expect(first && Near(first->x, 20.0) && Near(first->y, 287.0),
           "first item text follows its bullet");
    Expect(second && Near(second->x, 20.0) && Near(second->y, 282.0),
           "second item on the next line without a blank line");
    Expect(f.renderer.FindText("- first") == nullptr,
           "dash marker is not drawn as text");
  }

  // Inline table.
  {
    Fixture f;
    LayoutContext context = f.Start();
    f.writer.Write(context, "<table> a | b <row> c | d <table> after",
                   Style::Italic, TextClass::Body);
    const DrawnText *a = f.renderer.FindText("a");
    const DrawnText *c = f.renderer.FindText("c");
    const DrawnText *after = f.renderer.FindText("after");
    Expect(a && a->style == Style::Bold && Near(a->y, 284.0),
           "header row after the outer margin");
    Expect(c && Near(c->y, 276.0), "body row below");
    Expect(after && Near(after->x, 10.0) && Near(after->y, 268.0) &&
               after->style == Style::Regular,
           "text resumes in regular below the table");
  }

  // Table from the record.
  {
    Fixture f;
    LayoutContext context = f.Start();
    std::vector<ParsedTable> records = {
        TableFromGrid("", {"Level"}, {{"1"}, {"2"}})};
    f.writer.Write(context, "intro\n[table][0]\n\\[table][0]", Style::Regular,
                   TextClass::Body, records);
    Expect(f.renderer.FindText("Level") != nullptr, "record table drawn");
    Expect(f.renderer.FindText("[table][0]") != nullptr,
           "escaped reference is text");
  }

  // Words after a table reference in the same paragraph are dropped.
  {
    Fixture f;
    LayoutContext context = f.Start();
    std::vector<ParsedTable> records = {
        TableFromGrid("", {"Level"}, {{"1"}, {"2"}})};
    f.writer.Write(context, "[table][0] stray words\nnext", Style::Regular,
                   TextClass::Body, records);
    bool strayDrawn = false;
    for (const DrawnText &text : f.renderer.texts)
      strayDrawn = strayDrawn || text.text.find("stray") != std::string::npos;
    Expect(!strayDrawn, "rest of the reference paragraph is skipped");
    const DrawnText *next = f.renderer.FindText("next");
    const DrawnText *level = f.renderer.FindText("Level");
    Expect(next && level && Near(next->x, 10.0) && next->y < level->y,
           "next paragraph starts below the table");
  }

  // An unclosed table is still drawn.
  {
    Fixture f;
    LayoutContext context = f.Start();
    f.writer.Write(context, "<table> x | y", Style::Regular, TextClass::Body);
    Expect(f.renderer.FindText("x") && f.renderer.FindText("y"),
           "unclosed table cells drawn");
  }

  return FailureCount() ? 1 : 0;
}
