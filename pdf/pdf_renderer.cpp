#include "pdf_renderer.h"

#include "pdf_writer.h"

#include <iomanip>
#include <utility>

namespace spellscribe {
namespace pdf {

namespace {

const char *const kBackgroundKey = "Im1";

std::vector<uint32_t> DecodeUtf8(const std::string &utf8) {
  std::vector<uint32_t> codepoints;
  size_t i = 0;
  while (i < utf8.size()) {
    unsigned char lead = static_cast<unsigned char>(utf8[i]);
    size_t length = 1;
    uint32_t cp = lead;
    if ((lead >> 5) == 0x6) {
      length = 2;
      cp = lead & 0x1F;
    } else if ((lead >> 4) == 0xE) {
      length = 3;
      cp = lead & 0x0F;
    } else if ((lead >> 3) == 0x1E) {
      length = 4;
      cp = lead & 0x07;
    } else if (lead >= 0x80) {
      cp = 0xFFFD;
    }
    if (i + length > utf8.size()) {
      codepoints.push_back(0xFFFD);
      break;
    }
    for (size_t k = 1; k < length; ++k)
      cp = (cp << 6) | (static_cast<unsigned char>(utf8[i + k]) & 0x3F);
    codepoints.push_back(cp);
    i += length;
  }
  return codepoints;
}

} // namespace

std::string EncodePdfTextString(const std::string &utf8) {
  bool ascii = true;
  for (unsigned char ch : utf8)
    ascii = ascii && ch < 0x80;
  if (ascii)
    return "(" + EscapePdfString(utf8) + ")";

  std::ostringstream hex;
  hex << "<FEFF" << std::uppercase << std::hex << std::setfill('0');
  for (uint32_t cp : DecodeUtf8(utf8)) {
    if (cp > 0xFFFF) {
      cp -= 0x10000;
      hex << std::setw(4) << (0xD800 + (cp >> 10)) << std::setw(4)
          << (0xDC00 + (cp & 0x3FF));
    } else {
      hex << std::setw(4) << cp;
    }
  }
  hex << '>';
  return hex.str();
}

PdfRenderer::PdfRenderer(PdfFontSet fonts, std::array<std::string, 4> baseNames)
    : fonts_(std::move(fonts)), baseNames_(std::move(baseNames)) {}

const char *PdfRenderer::FontKey(Style style) {
  switch (style) {
  case Style::Bold:
    return "F2";
  case Style::Italic:
    return "F3";
  case Style::BoldItalic:
    return "F4";
  case Style::Regular:
    break;
  }
  return "F1";
}

bool PdfRenderer::SetBackground(const BackgroundOptions &background,
                                std::string &error) {
  if (!LoadJpegImage(background.imagePath, backgroundImage_, error))
    return false;
  background_ = background;
  hasBackground_ = true;
  return true;
}

PageHandle PdfRenderer::CreatePage(double width, double height) {
  auto page = std::make_unique<Page>();
  page->width = width * kMmToPt;
  page->height = height * kMmToPt;
  if (hasBackground_) {
    double imageWidth = background_.width > 0.0 ? background_.width : width;
    double imageHeight =
        background_.height > 0.0 ? background_.height : height;
    AppendImage(page->content, fmt_, kBackgroundKey,
                {background_.x * kMmToPt, background_.y * kMmToPt},
                imageWidth * kMmToPt, imageHeight * kMmToPt);
  }
  pages_.push_back(std::move(page));
  return pages_.size() - 1;
}

void PdfRenderer::DrawText(PageHandle page, double x, double y,
                           const std::string &text, Style style, double size,
                           const Color &color) {
  Page &target = *pages_.at(page);
  AppendText(target.content, target.cache, fmt_, {x * kMmToPt, y * kMmToPt},
             FontKey(style), size, color, EncodeWinAnsi(text));
}

void PdfRenderer::DrawLineSegment(PageHandle page, double x1, double y1,
                                  double x2, double y2, const Color &color,
                                  double thickness) {
  Page &target = *pages_.at(page);
  AppendLine(target.content, target.cache, fmt_, {x1 * kMmToPt, y1 * kMmToPt},
             {x2 * kMmToPt, y2 * kMmToPt}, color, thickness * kMmToPt);
}

void PdfRenderer::AddBookmark(const std::string &title, PageHandle page) {
  bookmarks_.push_back({title, page});
}

bool PdfRenderer::Save(const std::filesystem::path &path,
                       const std::string &title, std::string &error) const {
  if (pages_.empty()) {
    error = "The document has no pages.";
    return false;
  }

  for (const Bookmark &bookmark : bookmarks_) {
    if (bookmark.page >= pages_.size()) {
      error = "Bookmark '" + bookmark.title + "' points past the last page.";
      return false;
    }
  }

  std::vector<PdfObject> objects;
  std::array<PdfFontDefinition, 4> fontDefs;
  for (Style style : kAllStyles) {
    PdfFontDefinition &font = fontDefs[StyleIndex(style)];
    font.key = FontKey(style);
    font.baseName = baseNames_[StyleIndex(style)];
    if (!fonts_[StyleIndex(style)]) {
      error = std::string("No font loaded for style ") + StyleName(style);
      return false;
    }
    font.metrics = &fonts_[StyleIndex(style)]->Metrics();
    if (!AppendEmbeddedFontObjects(objects, font, error))
      return false;
  }

  size_t imageIndex = 0;
  if (hasBackground_)
    imageIndex = AppendImageObject(objects, backgroundImage_);

  std::ostringstream resources;
  resources << "<< /Font <<";
  for (const PdfFontDefinition &font : fontDefs)
    resources << " /" << font.key << ' ' << font.objectId << " 0 R";
  resources << " >>";
  if (imageIndex != 0)
    resources << " /XObject << /" << kBackgroundKey << ' ' << imageIndex
              << " 0 R >>";
  resources << " >>";

  // Content and page objects alternate, followed by the page tree.
  const size_t firstContent = objects.size() + 1;
  const size_t pagesIndex = firstContent + 2 * pages_.size();
  auto pageObjectId = [firstContent](PageHandle page) {
    return firstContent + 2 * page + 1;
  };

  for (size_t i = 0; i < pages_.size(); ++i) {
    const Page &page = *pages_[i];
    objects.push_back({MakeStreamObject(page.content.str(), true)});
    std::ostringstream pageObj;
    pageObj << "<< /Type /Page /Parent " << pagesIndex
            << " 0 R /MediaBox [0 0 " << fmt_.Format(page.width) << ' '
            << fmt_.Format(page.height) << "] /Contents " << objects.size()
            << " 0 R /Resources " << resources.str() << " >>";
    objects.push_back({pageObj.str()});
  }

  std::ostringstream kids;
  for (size_t i = 0; i < pages_.size(); ++i)
    kids << (i ? " " : "") << pageObjectId(i) << " 0 R";
  objects.push_back({"<< /Type /Pages /Kids [" + kids.str() + "] /Count " +
                     std::to_string(pages_.size()) + " >>"});

  size_t outlinesIndex = 0;
  if (!bookmarks_.empty()) {
    outlinesIndex = objects.size() + 1;
    const size_t first = outlinesIndex + 1;
    const size_t last = outlinesIndex + bookmarks_.size();
    objects.push_back({"<< /Type /Outlines /First " + std::to_string(first) +
                       " 0 R /Last " + std::to_string(last) + " 0 R /Count " +
                       std::to_string(bookmarks_.size()) + " >>"});
    for (size_t i = 0; i < bookmarks_.size(); ++i) {
      const size_t id = first + i;
      std::ostringstream item;
      item << "<< /Title " << EncodePdfTextString(bookmarks_[i].title)
           << " /Parent " << outlinesIndex << " 0 R";
      if (id > first)
        item << " /Prev " << id - 1 << " 0 R";
      if (id < last)
        item << " /Next " << id + 1 << " 0 R";
      item << " /Dest [" << pageObjectId(bookmarks_[i].page)
           << " 0 R /Fit] >>";
      objects.push_back({item.str()});
    }
  }

  std::ostringstream catalog;
  catalog << "<< /Type /Catalog /Pages " << pagesIndex << " 0 R";
  if (outlinesIndex != 0)
    catalog << " /Outlines " << outlinesIndex << " 0 R /PageMode /UseOutlines";
  catalog << " >>";
  objects.push_back({catalog.str()});
  const size_t catalogIndex = objects.size();

  objects.push_back({"<< /Title " + EncodePdfTextString(title) +
                     " /Producer (Spellscribe) >>"});
  const size_t infoIndex = objects.size();

  return WritePdfDocument(path, objects, catalogIndex, infoIndex, error);
}

} // namespace pdf
} // namespace spellscribe
