#pragma once

#include "pdf_font_metrics.h"
#include "pdf_graphics_encoder.h"
#include "pdf_objects.h"
#include "renderer.h"
#include "spellbookconfig.h"

#include <array>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace spellscribe {
namespace pdf {

using PdfFontSet = std::array<std::shared_ptr<const TtfMetricsProvider>, 4>;

// Renderer that records pages as PDF content streams and writes the whole
// document on Save(). Takes page millimetres, emits points.
class PdfRenderer : public Renderer {
public:
  // `baseNames` are the PDF font names per style.
  PdfRenderer(PdfFontSet fonts, std::array<std::string, 4> baseNames);

  // Draws the JPEG on every page created afterwards.
  bool SetBackground(const BackgroundOptions &background, std::string &error);

  PageHandle CreatePage(double width, double height) override;
  void DrawText(PageHandle page, double x, double y, const std::string &text,
                Style style, double size, const Color &color) override;
  void DrawLineSegment(PageHandle page, double x1, double y1, double x2,
                       double y2, const Color &color,
                       double thickness) override;
  void AddBookmark(const std::string &title, PageHandle page) override;

  size_t PageCount() const { return pages_.size(); }

  bool Save(const std::filesystem::path &path, const std::string &title,
            std::string &error) const;

private:
  struct Page {
    double width = 0.0;
    double height = 0.0;
    std::ostringstream content;
    GraphicsStateCache cache;
  };

  struct Bookmark {
    std::string title;
    PageHandle page = 0;
  };

  static const char *FontKey(Style style);

  PdfFontSet fonts_;
  std::array<std::string, 4> baseNames_;
  FloatFormatter fmt_{3};
  std::vector<std::unique_ptr<Page>> pages_;
  std::vector<Bookmark> bookmarks_;
  bool hasBackground_ = false;
  BackgroundOptions background_;
  JpegImage backgroundImage_;
};

// PDF text string for outlines and document info: a literal for ASCII,
// UTF-16BE hex otherwise.
std::string EncodePdfTextString(const std::string &utf8);

} // namespace pdf
} // namespace spellscribe
