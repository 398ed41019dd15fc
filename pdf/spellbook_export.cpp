#include "spellbook_export.h"

#include "document.h"
#include "errors.h"
#include "logger.h"
#include "metrics_adapter.h"
#include "pdf_font_metrics.h"
#include "pdf_objects.h"
#include "pdf_renderer.h"
#include "spellbook_writer.h"

#include <set>
#include <sstream>

namespace spellscribe {

namespace {
const char *const kDefaultTitle = "Spellbook";
} // namespace

ExportResult CreateSpellbook(const std::string &title,
                             const std::vector<Spell> &spells,
                             const SpellbookConfig &config,
                             const std::filesystem::path &output) {
  ExportResult result;
  const std::string documentTitle = title.empty() ? kDefaultTitle : title;

  pdf::PdfFontSet pdfFonts;
  FontMetricsSet metricsFonts;
  std::array<std::string, 4> baseNames;
  std::set<std::string> usedNames;
  try {
    for (Style style : kAllStyles) {
      const std::string &path = config.Fonts().For(style);
      auto font = pdf::TtfMetricsProvider::Load(path);
      Logger::Instance().Log(std::string("Loaded ") + StyleName(style) +
                             " font " + path);
      if (font->Metrics().cffOutlines)
        Logger::Instance().Log(LogLevel::Warning,
                               "Embedding " + path +
                                   " as OpenType, the face has CFF outlines");
      std::string baseName = pdf::MakeFontBaseName(path);
      if (!usedNames.insert(baseName).second) {
        baseName += std::string("-") + StyleName(style);
        usedNames.insert(baseName);
      }
      baseNames[StyleIndex(style)] = baseName;
      pdfFonts[StyleIndex(style)] = font;
      metricsFonts[StyleIndex(style)] = font;
    }
  } catch (const MetricsUnavailable &e) {
    result.message = e.what();
    Logger::Instance().Log(LogLevel::Error, result.message);
    return result;
  }

  MetricsAdapter metrics(metricsFonts, config.Scalars(), config.Sizes(),
                         config.Spacing());
  pdf::PdfRenderer renderer(pdfFonts, baseNames);
  if (config.Background()) {
    std::string error;
    if (!renderer.SetBackground(*config.Background(), error)) {
      result.message = error;
      Logger::Instance().Log(LogLevel::Error, error);
      return result;
    }
  }

  Document document(renderer, metrics, config.Page(), config.PageNumbers());
  SpellbookWriter writer(document, config);
  writer.WriteTitlePage(documentTitle);
  for (const Spell &spell : spells)
    writer.WriteSpell(spell);

  std::string error;
  if (!renderer.Save(output, documentTitle, error)) {
    result.message = error;
    Logger::Instance().Log(LogLevel::Error, "PDF export failed: " + error);
    return result;
  }

  std::ostringstream message;
  message << "Wrote " << spells.size() << " spells on "
          << renderer.PageCount() << " pages to " << output.string();
  result.success = true;
  result.message = message.str();
  Logger::Instance().Log(result.message);
  return result;
}

} // namespace spellscribe
