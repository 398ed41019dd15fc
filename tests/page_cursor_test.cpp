#include "document.h"
#include "page_cursor.h"
#include "test_support.h"

#include <optional>

using namespace testsupport;

int main() {
  MetricsAdapter metrics = MakeMetrics(10.0, 5.0);
  RecordingRenderer renderer;
  Document document(renderer, metrics, MakePage(210.0, 300.0, 20.0),
                    std::nullopt);
  const FlowRegion region = document.TextRegion();
  Expect(Near(region.yMin, 20.0) && Near(region.yMax, 280.0),
         "text region excludes the margins");

  // 60 lines of 5 from y = 280 with the bottom at 20: the 53rd baseline would
  // land on 20, so it starts the second page.
  {
    PageHandle first = document.NewPage();
    LayoutContext context(region, {region.xMin, region.yMax}, first);
    PageCursor cursor(context, document);
    cursor.BeginBlock();
    std::vector<size_t> perPage(2, 0);
    double lastOnFirst = 0.0;
    for (int i = 0; i < 60; ++i) {
      cursor.AdvanceLine(5.0);
      if (context.pageIndex < perPage.size())
        ++perPage[context.pageIndex];
      if (context.pageIndex == 0)
        lastOnFirst = context.cursor.y;
    }
    Expect(perPage[0] == 52, "52 lines on the first page");
    Expect(perPage[1] == 8, "8 lines on the second page");
    Expect(Near(lastOnFirst, 25.0), "last baseline on the first page");
    Expect(Near(context.cursor.y, 280.0 - 7 * 5.0),
           "continues from the top of the second page");
    Expect(context.pages.Size() == 2, "flow sequence holds both pages");
    Expect(document.PageCount() == 2, "document appended one page");
  }

  // Pages already in the sequence are reused after a restore.
  {
    PageHandle start = document.NewPage();
    LayoutContext context(region, {region.xMin, 30.0}, start);
    PageCursor cursor(context, document);
    LayoutSnapshot snapshot = context.Save();
    cursor.NextPage();
    const size_t pagesAfterFirstPass = document.PageCount();
    context.Restore(snapshot);
    cursor.NextPage();
    Expect(document.PageCount() == pagesAfterFirstPass,
           "replaying a page break does not create another page");
    Expect(context.pageIndex == 1 && context.pages.Size() == 2,
           "replay lands on the same sequence entry");
    Expect(Near(context.cursor.y, region.yMax), "new page starts at the top");
  }

  // Settle keeps y unless it already sits on the bottom.
  {
    PageHandle start = document.NewPage();
    LayoutContext context(region, {region.xMin, 100.0}, start);
    PageCursor cursor(context, document);
    cursor.Settle();
    Expect(Near(context.cursor.y, 100.0) && context.pageIndex == 0,
           "settle inside the region is a no-op");
    context.cursor.y = region.yMin;
    cursor.Settle();
    Expect(context.pageIndex == 1 && Near(context.cursor.y, region.yMax),
           "settle on the bottom edge breaks the page");
  }

  // Newline always moves, even at the start of a block.
  {
    PageHandle start = document.NewPage();
    LayoutContext context(region, {region.xMin, 200.0}, start);
    PageCursor cursor(context, document);
    cursor.BeginBlock();
    cursor.Newline(5.0);
    Expect(Near(context.cursor.y, 195.0), "newline ignores the fresh block");
    cursor.AdvanceLine(5.0);
    Expect(Near(context.cursor.y, 190.0), "later lines advance");
  }

  return FailureCount() ? 1 : 0;
}
