#pragma once

#include "pdf_font_metrics.h"

#include <filesystem>
#include <string>
#include <vector>

namespace spellscribe {
namespace pdf {

struct PdfObject {
  std::string body;
};

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

struct PdfFontDefinition {
  // Resource name used in content streams, e.g. "F1".
  std::string key;
  std::string baseName;
  size_t objectId = 0;
  const TtfFontMetrics *metrics = nullptr;
};

struct JpegImage {
  int width = 0;
  int height = 0;
  int components = 3;
  std::string data;
};

// PDF name token for a font file: letters and digits of its stem.
std::string MakeFontBaseName(const std::filesystem::path &path);

// Stream object with /FlateDecode when compression succeeds.
std::string MakeStreamObject(const std::string &data, bool compress);

// Appends font file, descriptor and font dictionary. Sets font.objectId.
bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font, std::string &error);

// Reads a baseline or progressive JPEG and its frame size.
bool LoadJpegImage(const std::filesystem::path &path, JpegImage &image,
                   std::string &error);

// Appends an image XObject and returns its object id.
size_t AppendImageObject(std::vector<PdfObject> &objects,
                         const JpegImage &image);

} // namespace pdf
} // namespace spellscribe
