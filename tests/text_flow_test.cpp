#include "document.h"
#include "page_cursor.h"
#include "test_support.h"
#include "text_flow.h"

#include <optional>

using namespace testsupport;

namespace {

struct Fixture {
  Fixture()
      : metrics(MakeMetrics(10.0, 5.0)),
        document(renderer, metrics, MakePage(210.0, 297.0, 10.0),
                 std::nullopt),
        flow(document, colors) {}

  LayoutContext Start(double x, double y) {
    PageHandle page = document.NewPage();
    return LayoutContext(document.TextRegion(), {x, y}, page);
  }

  MetricsAdapter metrics;
  RecordingRenderer renderer;
  TextColors colors;
  Document document;
  TextFlowEngine flow;
};

bool DrawnAt(const DrawnText *text, double x, double y) {
  return text && Near(text->x, x) && Near(text->y, y);
}

} // namespace

int main() {
  {
    Fixture f;
    LayoutContext context = f.Start(10.0, 287.0);
    Cursor end = f.flow.Flow(context, "hello world", Style::Regular,
                             TextClass::Body);
    Expect(DrawnAt(f.renderer.FindText("hello world"), 10.0, 287.0),
           "first line starts at the cursor");
    Expect(Near(end.x, 65.0) && Near(end.y, 287.0),
           "cursor ends after the last character");
  }

  {
    Fixture f;
    LayoutContext context = f.Start(10.0, 287.0);
    f.flow.Flow(context, "first\nsecond", Style::Regular, TextClass::Body);
    Expect(DrawnAt(f.renderer.FindText("first"), 10.0, 287.0),
           "first paragraph is not indented");
    Expect(DrawnAt(f.renderer.FindText("second"), 17.5, 282.0),
           "later paragraphs start a tabbed new line");
  }

  {
    // 38 characters per line: three nine-letter words fit, four do not.
    Fixture f;
    LayoutContext context = f.Start(10.0, 287.0);
    std::string text;
    for (int i = 0; i < 10; ++i)
      text += "abcdefghi ";
    f.flow.Flow(context, text, Style::Regular, TextClass::Body);
    Expect(f.renderer.texts.size() == 4, "ten words wrap onto four lines");
    for (size_t i = 0; i < f.renderer.texts.size(); ++i) {
      const DrawnText &line = f.renderer.texts[i];
      Expect(Near(line.x, 10.0) && Near(line.y, 287.0 - 5.0 * i),
             "wrapped line " + std::to_string(i) + " position");
    }
  }

  {
    Fixture f;
    LayoutContext context = f.Start(10.0, 287.0);
    f.flow.Flow(context, "intro\n- one\n\xE2\x80\xA2 two\nafter", Style::Regular,
                TextClass::Body);
    const auto &texts = f.renderer.texts;
    Expect(texts.size() == 6, "intro, two bullets with text, after");
    if (texts.size() == 6) {
      Expect(texts[1].text == "\xE2\x80\xA2 " && Near(texts[1].x, 10.0) &&
                 Near(texts[1].y, 277.0),
             "blank line before the list, bullet at the margin");
      Expect(texts[2].text == "one" && Near(texts[2].x, 20.0),
             "bullet text is indented by the bullet width");
      Expect(Near(texts[3].y, 272.0) && Near(texts[4].y, 272.0) &&
                 texts[4].text == "two",
             "consecutive bullets are not separated");
      Expect(texts[5].text == "after" && Near(texts[5].y, 262.0) &&
                 Near(texts[5].x, 17.5),
             "blank line after the list");
    }
  }

  {
    Fixture f;
    LayoutContext context = f.Start(10.0, 287.0);
    f.flow.Flow(context, "a\n\n   \nb", Style::Regular, TextClass::Body);
    Expect(DrawnAt(f.renderer.FindText("b"), 17.5, 282.0),
           "empty paragraphs are skipped");
  }

  {
    Fixture f;
    LayoutContext context = f.Start(10.0, 12.0);
    f.flow.Flow(context, "a\nb", Style::Regular, TextClass::Body);
    const DrawnText *b = f.renderer.FindText("b");
    Expect(b && b->page == 1 && Near(b->y, 287.0),
           "text continues at the top of a new page");
    Expect(context.pages.Size() == 2 && context.pageIndex == 1,
           "flow sequence records the new page");
  }

  {
    Fixture f;
    PageHandle page = f.document.NewPage();
    LayoutContext context({10.0, 10.0, 10.0, 287.0}, {10.0, 287.0}, page);
    f.flow.Flow(context, "nothing fits", Style::Regular, TextClass::Body);
    Expect(f.renderer.texts.empty(), "degenerate region draws nothing");
  }

  {
    Fixture f;
    LayoutContext context = f.Start(10.0, 287.0);
    f.flow.Flow(context, "\\<r> stays \\\\twice", Style::Regular,
                TextClass::Body);
    Expect(f.renderer.FindText("<r> stays \\twice") != nullptr,
           "one escape character is removed per token");
  }

  {
    Fixture f;
    LayoutContext context = f.Start(205.0, 287.0);
    f.flow.Flow(context, "past", Style::Regular, TextClass::Body);
    Expect(DrawnAt(f.renderer.FindText("past"), 17.5, 282.0),
           "a cursor past the right edge starts a new line");
  }

  {
    Fixture f;
    LayoutContext context = f.Start(10.0, 200.0);
    f.flow.FlowCentered(context, {"abcd", "ab"}, 10.0, 50.0, Style::Bold,
                        TextClass::Title);
    Expect(DrawnAt(f.renderer.FindText("abcd"), 20.0, 200.0),
           "centered line on the current y");
    Expect(DrawnAt(f.renderer.FindText("ab"), 25.0, 195.0),
           "second centered line one newline down");
  }

  return FailureCount() ? 1 : 0;
}
