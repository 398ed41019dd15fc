#include "pdf_font_metrics.h"

#include "errors.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

namespace spellscribe {
namespace pdf {

namespace {

// Code points of WinAnsi codes 0x80 to 0x9F.
constexpr std::array<uint32_t, 32> kWinAnsiHigh = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint) {
  if (codepoint <= 0x7F)
    return static_cast<unsigned char>(codepoint);
  if (codepoint >= 0xA0 && codepoint <= 0xFF)
    return static_cast<unsigned char>(codepoint);
  for (size_t i = 0; i < kWinAnsiHigh.size(); ++i) {
    if (kWinAnsiHigh[i] != 0 && kWinAnsiHigh[i] == codepoint)
      return static_cast<unsigned char>(0x80 + i);
  }
  return '?';
}

uint16_t ReadU16(const std::string &data, size_t offset) {
  return static_cast<uint16_t>(
      (static_cast<unsigned char>(data[offset]) << 8) |
      static_cast<unsigned char>(data[offset + 1]));
}

int16_t ReadS16(const std::string &data, size_t offset) {
  return static_cast<int16_t>(ReadU16(data, offset));
}

uint32_t ReadU32(const std::string &data, size_t offset) {
  return (static_cast<uint32_t>(static_cast<unsigned char>(data[offset])) << 24) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 1])) << 16) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 2])) << 8) |
         static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 3]));
}

uint32_t MakeTag(char a, char b, char c, char d) {
  return (static_cast<uint32_t>(a) << 24) |
         (static_cast<uint32_t>(b) << 16) |
         (static_cast<uint32_t>(c) << 8) |
         static_cast<uint32_t>(d);
}

// Format 4 subtable of the cmap, Windows Unicode BMP preferred.
class Cmap4 {
public:
  bool Parse(const std::string &data, uint32_t offset, uint32_t length) {
    cmap_ = data.substr(offset, std::min<size_t>(length, data.size() - offset));
    if (cmap_.size() < 4)
      return false;
    uint16_t tables = ReadU16(cmap_, 2);
    size_t chosen = 0;
    for (uint16_t i = 0; i < tables; ++i) {
      size_t record = 4 + static_cast<size_t>(i) * 8;
      if (record + 8 > cmap_.size())
        return false;
      uint16_t platformId = ReadU16(cmap_, record);
      uint16_t encodingId = ReadU16(cmap_, record + 2);
      uint32_t subOffset = ReadU32(cmap_, record + 4);
      if (static_cast<size_t>(subOffset) + 2 > cmap_.size() ||
          ReadU16(cmap_, subOffset) != 4)
        continue;
      if (platformId == 3 && (encodingId == 1 || encodingId == 0)) {
        chosen = subOffset;
        break;
      }
      if (platformId == 0 && chosen == 0)
        chosen = subOffset;
    }
    if (chosen == 0 || chosen + 14 > cmap_.size())
      return false;
    segCount_ = ReadU16(cmap_, chosen + 6) / 2;
    endCount_ = chosen + 14;
    startCount_ = endCount_ + 2 * segCount_ + 2;
    idDelta_ = startCount_ + 2 * segCount_;
    idRangeOffset_ = idDelta_ + 2 * segCount_;
    return idRangeOffset_ + 2 * segCount_ <= cmap_.size();
  }

  uint16_t Glyph(uint32_t codepoint) const {
    if (codepoint > 0xFFFF)
      return 0;
    const uint16_t code = static_cast<uint16_t>(codepoint);
    for (uint16_t i = 0; i < segCount_; ++i) {
      uint16_t end = ReadU16(cmap_, endCount_ + 2 * i);
      uint16_t start = ReadU16(cmap_, startCount_ + 2 * i);
      if (code < start || code > end)
        continue;
      int16_t delta = ReadS16(cmap_, idDelta_ + 2 * i);
      uint16_t rangeOffset = ReadU16(cmap_, idRangeOffset_ + 2 * i);
      if (rangeOffset == 0)
        return static_cast<uint16_t>(code + delta);
      size_t glyphOffset =
          idRangeOffset_ + 2 * i + rangeOffset + 2 * (code - start);
      if (glyphOffset + 2 > cmap_.size())
        return 0;
      uint16_t glyph = ReadU16(cmap_, glyphOffset);
      if (glyph == 0)
        return 0;
      return static_cast<uint16_t>(glyph + delta);
    }
    return 0;
  }

private:
  std::string cmap_;
  uint16_t segCount_ = 0;
  size_t endCount_ = 0;
  size_t startCount_ = 0;
  size_t idDelta_ = 0;
  size_t idRangeOffset_ = 0;
};

} // namespace

uint32_t WinAnsiToUnicode(unsigned char code) {
  if (code >= 0x80 && code <= 0x9F)
    return kWinAnsiHigh[code - 0x80];
  return code;
}

std::string EncodeWinAnsi(const std::string &utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    unsigned char lead = static_cast<unsigned char>(utf8[i]);
    uint32_t codepoint = 0;
    size_t length = 0;
    if (lead < 0x80) {
      codepoint = lead;
      length = 1;
    } else if ((lead >> 5) == 0x6 && i + 1 < utf8.size()) {
      codepoint = ((lead & 0x1F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 1]) & 0x3F);
      length = 2;
    } else if ((lead >> 4) == 0xE && i + 2 < utf8.size()) {
      codepoint = ((lead & 0x0F) << 12) |
                  ((static_cast<unsigned char>(utf8[i + 1]) & 0x3F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 2]) & 0x3F);
      length = 3;
    } else if ((lead >> 3) == 0x1E && i + 3 < utf8.size()) {
      codepoint = ((lead & 0x07) << 18) |
                  ((static_cast<unsigned char>(utf8[i + 1]) & 0x3F) << 12) |
                  ((static_cast<unsigned char>(utf8[i + 2]) & 0x3F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 3]) & 0x3F);
      length = 4;
    } else {
      out.push_back('?');
      ++i;
      continue;
    }
    out.push_back(static_cast<char>(EncodeWinAnsiCodepoint(codepoint)));
    i += length;
  }
  return out;
}

bool ReadFileToString(const std::filesystem::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool FindTable(const std::string &data, uint32_t tag, uint32_t &offset,
               uint32_t &length) {
  if (data.size() < 12)
    return false;
  uint16_t numTables = ReadU16(data, 4);
  for (uint16_t i = 0; i < numTables; ++i) {
    size_t record = 12 + static_cast<size_t>(i) * 16;
    if (record + 16 > data.size())
      return false;
    if (ReadU32(data, record) == tag) {
      offset = ReadU32(data, record + 8);
      length = ReadU32(data, record + 12);
      return static_cast<uint64_t>(offset) + length <= data.size();
    }
  }
  return false;
}

bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics, std::string &error) {
  metrics = TtfFontMetrics{};
  std::string data;
  if (!ReadFileToString(path, data)) {
    error = "Unable to read font " + path.string();
    return false;
  }
  if (data.size() < 12) {
    error = "Font file is truncated: " + path.string();
    return false;
  }

  uint32_t headOffset = 0, headLength = 0;
  uint32_t hheaOffset = 0, hheaLength = 0;
  uint32_t maxpOffset = 0, maxpLength = 0;
  uint32_t hmtxOffset = 0, hmtxLength = 0;
  uint32_t cmapOffset = 0, cmapLength = 0;
  const struct {
    const char *name;
    uint32_t tag;
    uint32_t *offset;
    uint32_t *length;
  } required[] = {
      {"head", MakeTag('h', 'e', 'a', 'd'), &headOffset, &headLength},
      {"hhea", MakeTag('h', 'h', 'e', 'a'), &hheaOffset, &hheaLength},
      {"maxp", MakeTag('m', 'a', 'x', 'p'), &maxpOffset, &maxpLength},
      {"hmtx", MakeTag('h', 'm', 't', 'x'), &hmtxOffset, &hmtxLength},
      {"cmap", MakeTag('c', 'm', 'a', 'p'), &cmapOffset, &cmapLength},
  };
  for (const auto &table : required) {
    if (!FindTable(data, table.tag, *table.offset, *table.length)) {
      error = std::string("Font has no usable ") + table.name +
              " table: " + path.string();
      return false;
    }
  }

  uint32_t unusedOffset = 0, unusedLength = 0;
  metrics.cffOutlines =
      !FindTable(data, MakeTag('g', 'l', 'y', 'f'), unusedOffset,
                 unusedLength) &&
      FindTable(data, MakeTag('C', 'F', 'F', ' '), unusedOffset, unusedLength);

  if (headOffset + 54 > data.size() || hheaOffset + 36 > data.size() ||
      maxpOffset + 6 > data.size()) {
    error = "Font header tables are truncated: " + path.string();
    return false;
  }
  metrics.unitsPerEm = ReadU16(data, headOffset + 18);
  metrics.xMin = ReadS16(data, headOffset + 36);
  metrics.yMin = ReadS16(data, headOffset + 38);
  metrics.xMax = ReadS16(data, headOffset + 40);
  metrics.yMax = ReadS16(data, headOffset + 42);
  metrics.ascent = ReadS16(data, hheaOffset + 4);
  metrics.descent = ReadS16(data, hheaOffset + 6);
  metrics.lineGap = ReadS16(data, hheaOffset + 8);
  uint16_t numHMetrics = ReadU16(data, hheaOffset + 34);
  uint16_t numGlyphs = ReadU16(data, maxpOffset + 4);
  if (numGlyphs == 0 || numHMetrics == 0 || metrics.unitsPerEm == 0 ||
      hmtxOffset + static_cast<uint32_t>(numHMetrics) * 4 > data.size()) {
    error = "Font has no horizontal metrics: " + path.string();
    return false;
  }

  std::vector<int> advanceWidths(std::max(numGlyphs, numHMetrics), 0);
  int lastAdvance = 0;
  for (uint16_t i = 0; i < numHMetrics; ++i) {
    lastAdvance = ReadU16(data, hmtxOffset + static_cast<size_t>(i) * 4);
    advanceWidths[i] = lastAdvance;
  }
  for (size_t i = numHMetrics; i < advanceWidths.size(); ++i)
    advanceWidths[i] = lastAdvance;

  uint32_t os2Offset = 0, os2Length = 0;
  if (FindTable(data, MakeTag('O', 'S', '/', '2'), os2Offset, os2Length) &&
      os2Length >= 90 && ReadU16(data, os2Offset) >= 2)
    metrics.capHeight = ReadS16(data, os2Offset + 88);
  if (metrics.capHeight == 0)
    metrics.capHeight = metrics.ascent;

  uint32_t postOffset = 0, postLength = 0;
  if (FindTable(data, MakeTag('p', 'o', 's', 't'), postOffset, postLength) &&
      postLength >= 8)
    metrics.italicAngle = ReadS16(data, postOffset + 4);

  Cmap4 cmap;
  if (!cmap.Parse(data, cmapOffset, cmapLength)) {
    error = "Font has no Unicode cmap: " + path.string();
    return false;
  }

  const int missingWidth = advanceWidths[0];
  for (size_t code = 0; code < metrics.advanceWidths.size(); ++code) {
    uint32_t codepoint = WinAnsiToUnicode(static_cast<unsigned char>(code));
    uint16_t glyph = codepoint ? cmap.Glyph(codepoint) : 0;
    int advance = missingWidth;
    if (glyph != 0 && glyph < advanceWidths.size())
      advance = advanceWidths[glyph];
    metrics.advanceWidths[code] = advance;
    metrics.widths1000[code] =
        static_cast<int>(std::lround(advance * 1000.0 / metrics.unitsPerEm));
  }

  metrics.data = std::move(data);
  metrics.valid = true;
  return true;
}

std::filesystem::path FindSystemFontPath(Style style) {
  struct FontCandidate {
    const char *regular;
    const char *bold;
    const char *italic;
    const char *boldItalic;
  };
  const std::vector<FontCandidate> candidates = {
#ifdef _WIN32
      {"C:/Windows/Fonts/times.ttf", "C:/Windows/Fonts/timesbd.ttf",
       "C:/Windows/Fonts/timesi.ttf", "C:/Windows/Fonts/timesbi.ttf"},
#elif defined(__APPLE__)
      {"/System/Library/Fonts/Supplemental/Times New Roman.ttf",
       "/System/Library/Fonts/Supplemental/Times New Roman Bold.ttf",
       "/System/Library/Fonts/Supplemental/Times New Roman Italic.ttf",
       "/System/Library/Fonts/Supplemental/Times New Roman Bold Italic.ttf"},
#else
      {"/usr/share/fonts/truetype/liberation/LiberationSerif-Regular.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSerif-Bold.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSerif-Italic.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSerif-BoldItalic.ttf"},
      {"/usr/share/fonts/truetype/dejavu/DejaVuSerif.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSerif-Bold.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSerif-Italic.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSerif-BoldItalic.ttf"},
      {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-Oblique.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-BoldOblique.ttf"},
#endif
  };
  for (const auto &candidate : candidates) {
    const char *path = candidate.regular;
    switch (style) {
    case Style::Bold:
      path = candidate.bold;
      break;
    case Style::Italic:
      path = candidate.italic;
      break;
    case Style::BoldItalic:
      path = candidate.boldItalic;
      break;
    case Style::Regular:
      break;
    }
    std::error_code ec;
    if (path && std::filesystem::exists(path, ec))
      return std::filesystem::path(path);
  }
  return {};
}

TtfMetricsProvider::TtfMetricsProvider(TtfFontMetrics metrics)
    : metrics_(std::move(metrics)) {}

std::shared_ptr<TtfMetricsProvider>
TtfMetricsProvider::Load(const std::filesystem::path &path) {
  TtfFontMetrics metrics;
  std::string error;
  if (!LoadTtfFontMetrics(path, metrics, error))
    throw MetricsUnavailable(error);
  return std::make_shared<TtfMetricsProvider>(std::move(metrics));
}

double TtfMetricsProvider::AdvanceUnits(const std::string &text) const {
  double units = 0.0;
  for (unsigned char ch : EncodeWinAnsi(text)) {
    if (ch == '\n' || ch == '\r')
      continue;
    units += metrics_.advanceWidths[ch];
  }
  return units;
}

} // namespace pdf
} // namespace spellscribe
