#include "document.h"
#include "spell.h"
#include "spellbook_writer.h"
#include "test_support.h"

using namespace testsupport;

namespace {

FontPaths PlaceholderFonts() {
  FontPaths fonts;
  fonts.regular = "regular.ttf";
  fonts.bold = "bold.ttf";
  fonts.italic = "italic.ttf";
  fonts.boldItalic = "bold_italic.ttf";
  return fonts;
}

Spell MakeShield() {
  Spell spell;
  spell.name = "Shield";
  spell.level = Level::Level1;
  spell.school = MagicSchool::Abjuration;
  spell.range = Range{};
  spell.hasVerbal = true;
  spell.hasSomatic = true;
  Duration duration;
  duration.kind = Duration::Kind::Rounds;
  spell.duration = duration;
  spell.description = "Line one.\nLine two.";
  return spell;
}

bool Above(const DrawnText *upper, const DrawnText *lower) {
  return upper && lower && upper->page == lower->page && upper->y > lower->y;
}

} // namespace

int main() {
  RecordingRenderer renderer;
  MetricsAdapter metrics = MakeMetrics(10.0, 5.0);
  SpellbookConfig config = SpellbookConfig::WithDefaults(PlaceholderFonts());
  Document document(renderer, metrics, MakePage(210.0, 297.0, 10.0),
                    config.PageNumbers());
  SpellbookWriter writer(document, config);

  writer.WriteTitlePage("");
  {
    const DrawnText *title = renderer.FindText("Spellbook");
    Expect(title && title->page == 0, "empty title falls back to Spellbook");
    Expect(title && Near(title->x, 82.5), "title is centered horizontally");
    Expect(title && title->y > 10.0 && title->y < 287.0,
           "title sits inside the text region");
    Expect(renderer.texts.size() == 1, "title page carries no page number");
    Expect(renderer.bookmarks.size() == 1 &&
               renderer.bookmarks[0].first == "Title Page" &&
               renderer.bookmarks[0].second == 0,
           "title page is bookmarked");
  }

  writer.WriteSpell(MakeShield());
  {
    Expect(renderer.pages.size() == 2, "spell starts a new page");
    Expect(renderer.bookmarks.size() == 2 &&
               renderer.bookmarks[1].first == "Shield" &&
               renderer.bookmarks[1].second == 1,
           "spell page is bookmarked with the spell name");

    const DrawnText *number = renderer.FindText("1");
    Expect(number && number->page == 1 && Near(number->x, 5.0) &&
               Near(number->y, 4.0),
           "first spell page is numbered 1");

    const DrawnText *name = renderer.FindText("Shield");
    Expect(name && Near(name->x, 10.0) &&
               name->color == config.Colors().header,
           "spell name is drawn in the header color");

    const DrawnText *levelSchool = renderer.FindText("1st-level abjuration");
    Expect(levelSchool && levelSchool->style == Style::Italic,
           "level and school line is italic");

    const DrawnText *castingLabel = renderer.FindText("Casting Time:");
    const DrawnText *castingValue = renderer.FindText("1 action");
    Expect(castingLabel && castingLabel->style == Style::Bold &&
               Near(castingLabel->x, 10.0),
           "field label is bold");
    Expect(castingValue && castingValue->style == Style::Regular &&
               Near(castingValue->x, 80.0) &&
               Near(castingValue->y, castingLabel->y),
           "field value follows its label on the same line");

    const DrawnText *range = renderer.FindText("Range:");
    const DrawnText *components = renderer.FindText("Components:");
    const DrawnText *duration = renderer.FindText("Duration:");
    const DrawnText *lineOne = renderer.FindText("Line one.");
    const DrawnText *lineTwo = renderer.FindText("Line two.");
    Expect(renderer.FindText("Self") && renderer.FindText("V, S") &&
               renderer.FindText("1 round"),
           "field values are written");
    Expect(Above(name, levelSchool) && Above(levelSchool, castingLabel) &&
               Above(castingLabel, range) && Above(range, components) &&
               Above(components, duration) && Above(duration, lineOne) &&
               Above(lineOne, lineTwo),
           "header block precedes the description");
    Expect(range && components && Near(range->y - components->y, 5.0),
           "body fields are one body newline apart");
    Expect(lineTwo && Near(lineTwo->x, 17.5),
           "later description paragraphs are indented");
  }

  Spell fireball = MakeShield();
  fireball.name = "Fireball";
  fireball.level = Level::Level3;
  fireball.description = "Boom.";
  fireball.upcastDescription = "More dice.";
  writer.WriteSpell(fireball);
  {
    Expect(renderer.pages.size() == 3, "each spell gets its own page");
    const DrawnText *number = renderer.FindText("2");
    Expect(number && number->page == 2, "second spell page is numbered 2");

    const DrawnText *prefix =
        renderer.FindText("Using a Higher-Level Spell Slot.");
    const DrawnText *upcast = renderer.FindText("More dice.");
    Expect(prefix && prefix->style == Style::BoldItalic &&
               Near(prefix->x, 17.5),
           "upcast paragraph opens with a bold italic prefix");
    // The prefix leaves too little room, so the text wraps to the margin.
    Expect(upcast && prefix && upcast->style == Style::Regular &&
               Near(upcast->x, 10.0) && Near(upcast->y, prefix->y - 5.0),
           "upcast text continues after its prefix");
  }

  // A description too long for one page continues on numbered pages.
  Spell longSpell = MakeShield();
  longSpell.name = "Long";
  longSpell.description.clear();
  for (int i = 0; i < 80; ++i)
    longSpell.description += "Paragraph.\n";
  writer.WriteSpell(longSpell);
  {
    Expect(renderer.pages.size() == 5, "long description adds a page");
    Expect(renderer.bookmarks.size() == 4 &&
               renderer.bookmarks.back().second == 3,
           "continuation pages are not bookmarked");
    const DrawnText *number = renderer.FindText("4");
    Expect(number && number->page == 4, "continuation page is numbered");
  }

  return FailureCount() ? 1 : 0;
}
