#pragma once

#include "font_metrics_provider.h"
#include "typography.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace spellscribe {
namespace pdf {

// Metrics of a TrueType or OpenType face, with advance widths indexed by
// WinAnsi code.
struct TtfFontMetrics {
  int unitsPerEm = 1000;
  int ascent = 0;
  int descent = 0;
  int lineGap = 0;
  int capHeight = 0;
  int italicAngle = 0;
  int xMin = 0;
  int yMin = 0;
  int xMax = 0;
  int yMax = 0;
  std::array<int, 256> advanceWidths{};
  std::array<int, 256> widths1000{};
  std::string data;
  // CFF outlines instead of a glyf table.
  bool cffOutlines = false;
  bool valid = false;
};

std::string EncodeWinAnsi(const std::string &utf8);
// Unicode code point of a WinAnsi code, 0 for unassigned codes.
uint32_t WinAnsiToUnicode(unsigned char code);

bool ReadFileToString(const std::filesystem::path &path, std::string &out);
bool FindTable(const std::string &data, uint32_t tag, uint32_t &offset,
               uint32_t &length);
bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics, std::string &error);

// First installed system font for the style, empty when none was found.
std::filesystem::path FindSystemFontPath(Style style);

class TtfMetricsProvider : public FontMetricsProvider {
public:
  explicit TtfMetricsProvider(TtfFontMetrics metrics);

  // Throws MetricsUnavailable when the file cannot be read or parsed.
  static std::shared_ptr<TtfMetricsProvider>
  Load(const std::filesystem::path &path);

  double AdvanceUnits(const std::string &text) const override;
  int UnitsPerEm() const override { return metrics_.unitsPerEm; }
  int Ascent() const override { return metrics_.ascent; }
  int Descent() const override { return metrics_.descent; }

  const TtfFontMetrics &Metrics() const { return metrics_; }

private:
  TtfFontMetrics metrics_;
};

} // namespace pdf
} // namespace spellscribe
