#include "errors.h"
#include "pdf_font_metrics.h"
#include "pdf_renderer.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace spellscribe;
using namespace spellscribe::pdf;

namespace {

void PutU16(std::string &data, size_t offset, uint16_t value) {
  data[offset] = static_cast<char>(value >> 8);
  data[offset + 1] = static_cast<char>(value & 0xFF);
}

void PutU32(std::string &data, size_t offset, uint32_t value) {
  PutU16(data, offset, static_cast<uint16_t>(value >> 16));
  PutU16(data, offset + 2, static_cast<uint16_t>(value & 0xFFFF));
}

// Smallest face the loader accepts up to the cmap, whose only subtable
// record points at `subtableOffset`.
std::string MinimalFont(uint32_t subtableOffset) {
  const char *tags[] = {"head", "hhea", "maxp", "hmtx", "cmap"};
  const uint32_t lengths[] = {54, 36, 6, 4, 12};
  std::string data(12 + 5 * 16, '\0');
  PutU16(data, 4, 5);
  uint32_t offset = static_cast<uint32_t>(data.size());
  for (size_t i = 0; i < 5; ++i) {
    const size_t record = 12 + i * 16;
    data.replace(record, 4, tags[i], 4);
    PutU32(data, record + 8, offset);
    PutU32(data, record + 12, lengths[i]);
    offset += lengths[i];
  }
  data.resize(offset, '\0');
  const size_t head = 92, hhea = 146, maxp = 182, hmtx = 188, cmap = 192;
  PutU16(data, head + 18, 1000);
  PutU16(data, hhea + 34, 1);
  PutU16(data, maxp + 4, 1);
  PutU16(data, hmtx, 500);
  PutU16(data, cmap + 2, 1);
  PutU16(data, cmap + 4, 3);
  PutU16(data, cmap + 6, 1);
  PutU32(data, cmap + 8, subtableOffset);
  return data;
}

} // namespace

int main() {
  const std::string input = "Euro € — test";
  const std::string encoded = EncodeWinAnsi(input);
  if (encoded.size() != 13) {
    std::cerr << "Each character should encode to one byte" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[5]) != 0x80) {
    std::cerr << "Euro sign was not mapped to WinAnsi 0x80" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[7]) != 0x97) {
    std::cerr << "Em dash was not mapped to WinAnsi 0x97" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(EncodeWinAnsi("\xE2\x80\xA2")[0]) != 0x95) {
    std::cerr << "Bullet was not mapped to WinAnsi 0x95" << std::endl;
    return 1;
  }
  if (WinAnsiToUnicode(0x80) != 0x20AC || WinAnsiToUnicode('A') != 'A' ||
      WinAnsiToUnicode(0xE9) != 0xE9) {
    std::cerr << "Unexpected WinAnsi to Unicode mapping" << std::endl;
    return 1;
  }

  bool threw = false;
  try {
    TtfMetricsProvider::Load(std::filesystem::temp_directory_path() /
                             "spellscribe_missing_font.ttf");
  } catch (const MetricsUnavailable &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Missing font file should raise MetricsUnavailable"
              << std::endl;
    return 1;
  }

  // A cmap subtable offset at the top of the 32-bit range is rejected.
  {
    const std::filesystem::path badPath =
        std::filesystem::temp_directory_path() / "spellscribe_bad_cmap.ttf";
    {
      std::ofstream out(badPath, std::ios::binary);
      const std::string data = MinimalFont(0xFFFFFFFFu);
      out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    TtfFontMetrics metrics;
    std::string error;
    const bool loaded = LoadTtfFontMetrics(badPath, metrics, error);
    std::filesystem::remove(badPath);
    if (loaded || error.find("no Unicode cmap") == std::string::npos) {
      std::cerr << "Out of range cmap offset should be rejected: " << error
                << std::endl;
      return 1;
    }
  }

  const std::filesystem::path fontPath = FindSystemFontPath(Style::Regular);
  if (fontPath.empty()) {
    std::cout << "No system font found, skipping font loading checks"
              << std::endl;
    return 0;
  }

  auto font = TtfMetricsProvider::Load(fontPath);
  if (font->UnitsPerEm() <= 0 || font->Ascent() <= 0 || font->Descent() >= 0) {
    std::cerr << "Implausible vertical metrics in " << fontPath << std::endl;
    return 1;
  }
  if (!(font->AdvanceUnits("mm") > font->AdvanceUnits("m")) ||
      font->AdvanceUnits("") != 0.0) {
    std::cerr << "Advance widths should add up" << std::endl;
    return 1;
  }

  // A small document through the PDF renderer.
  PdfFontSet fonts = {font, font, font, font};
  std::array<std::string, 4> baseNames = {"Regular", "Bold", "Italic",
                                          "BoldItalic"};
  PdfRenderer renderer(fonts, baseNames);
  PageHandle page = renderer.CreatePage(210.0, 297.0);
  renderer.DrawText(page, 10.0, 280.0, "Fireball", Style::Bold, 24.0, Color{});
  renderer.DrawLineSegment(page, 10.0, 270.0, 200.0, 270.0,
                           Color::FromRgb(213, 209, 224), 1.4);
  renderer.AddBookmark("Fireball", page);

  const std::filesystem::path outPath =
      std::filesystem::temp_directory_path() / "spellscribe_renderer_test.pdf";
  std::string error;
  if (!renderer.Save(outPath, "Test Book", error)) {
    std::cerr << error << std::endl;
    return 1;
  }
  std::ifstream in(outPath, std::ios::binary);
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  in.close();
  std::filesystem::remove(outPath);
  if (data.find("/Outlines") == std::string::npos ||
      data.find("/Title (Fireball)") == std::string::npos ||
      data.find("/FontFile") == std::string::npos) {
    std::cerr << "Saved document lacks outlines or embedded fonts"
              << std::endl;
    return 1;
  }

  renderer.AddBookmark("Nowhere", 5);
  if (renderer.Save(outPath, "Test Book", error)) {
    std::cerr << "Bookmark to a missing page should fail" << std::endl;
    return 1;
  }
  return 0;
}
