#include "pdf_objects.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace spellscribe {
namespace pdf {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision_) << value;
  return ss.str();
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(input.size());
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       input.size(), Z_BEST_COMPRESSION);
  if (zres != Z_OK) {
    error = "compress2 failed with code " + std::to_string(zres);
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

std::string MakeFontBaseName(const std::filesystem::path &path) {
  std::string name;
  for (char ch : path.stem().string()) {
    if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '-')
      name.push_back(ch);
  }
  return name.empty() ? "SpellscribeFont" : name;
}

std::string MakeStreamObject(const std::string &data, bool compress) {
  std::string compressed;
  std::string error;
  const bool useCompression =
      compress && !data.empty() && PdfDeflater::Compress(data, compressed, error);
  const std::string &streamData = useCompression ? compressed : data;
  std::ostringstream obj;
  obj << "<< /Length " << streamData.size();
  if (useCompression)
    obj << " /Filter /FlateDecode";
  obj << " >>\nstream\n" << streamData << "\nendstream";
  return obj.str();
}

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font, std::string &error) {
  if (!font.metrics || !font.metrics->valid || font.metrics->data.empty()) {
    error = "Font " + font.baseName + " has no data to embed.";
    return false;
  }
  const TtfFontMetrics &metrics = *font.metrics;
  const double scale = 1000.0 / metrics.unitsPerEm;
  auto scaled = [scale](int value) {
    return static_cast<int>(std::lround(value * scale));
  };

  std::string compressed;
  std::string deflateError;
  const bool useCompression =
      PdfDeflater::Compress(metrics.data, compressed, deflateError);
  const std::string &fontData = useCompression ? compressed : metrics.data;

  size_t fontFileIndex = objects.size() + 1;
  std::ostringstream fontFile;
  fontFile << "<< /Length " << fontData.size();
  if (metrics.cffOutlines)
    fontFile << " /Subtype /OpenType";
  else
    fontFile << " /Length1 " << metrics.data.size();
  if (useCompression)
    fontFile << " /Filter /FlateDecode";
  fontFile << " >>\nstream\n" << fontData << "\nendstream";
  objects.push_back({fontFile.str()});

  // Nonsymbolic, plus Italic when the face is slanted.
  int flags = 32;
  if (metrics.italicAngle != 0)
    flags |= 64;

  size_t descriptorIndex = objects.size() + 1;
  std::ostringstream descriptor;
  descriptor << "<< /Type /FontDescriptor /FontName /" << font.baseName
             << " /Flags " << flags << " /FontBBox [" << scaled(metrics.xMin)
             << ' ' << scaled(metrics.yMin) << ' ' << scaled(metrics.xMax)
             << ' ' << scaled(metrics.yMax) << "] /Ascent "
             << scaled(metrics.ascent) << " /Descent "
             << -std::abs(scaled(metrics.descent)) << " /CapHeight "
             << scaled(metrics.capHeight) << " /ItalicAngle "
             << metrics.italicAngle << " /StemV 80 /MissingWidth "
             << metrics.widths1000[0]
             << (metrics.cffOutlines ? " /FontFile3 " : " /FontFile2 ")
             << fontFileIndex << " 0 R >>";
  objects.push_back({descriptor.str()});

  size_t fontIndex = objects.size() + 1;
  std::ostringstream fontObject;
  fontObject << "<< /Type /Font /Subtype /TrueType /BaseFont /"
             << font.baseName << " /FirstChar 32 /LastChar 255 /Widths [";
  for (int code = 32; code <= 255; ++code) {
    fontObject << metrics.widths1000[static_cast<unsigned char>(code)];
    if (code != 255)
      fontObject << ' ';
  }
  fontObject << "] /FontDescriptor " << descriptorIndex
             << " 0 R /Encoding /WinAnsiEncoding >>";
  objects.push_back({fontObject.str()});

  font.objectId = fontIndex;
  return true;
}

bool LoadJpegImage(const std::filesystem::path &path, JpegImage &image,
                   std::string &error) {
  image = JpegImage{};
  if (!ReadFileToString(path, image.data)) {
    error = "Unable to read image " + path.string();
    return false;
  }
  const std::string &data = image.data;
  auto byte = [&data](size_t i) {
    return static_cast<unsigned char>(data[i]);
  };
  if (data.size() < 4 || byte(0) != 0xFF || byte(1) != 0xD8) {
    error = "Background image is not a JPEG file: " + path.string();
    return false;
  }

  size_t pos = 2;
  while (pos + 4 <= data.size()) {
    if (byte(pos) != 0xFF) {
      ++pos;
      continue;
    }
    unsigned char marker = byte(pos + 1);
    if (marker == 0xFF) {
      ++pos;
      continue;
    }
    if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
      pos += 2;
      continue;
    }
    size_t length = (static_cast<size_t>(byte(pos + 2)) << 8) | byte(pos + 3);
    // SOF0 to SOF15 except DHT, JPG and DAC.
    bool frame = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 &&
                 marker != 0xC8 && marker != 0xCC;
    if (frame) {
      if (pos + 10 > data.size())
        break;
      image.height = (byte(pos + 5) << 8) | byte(pos + 6);
      image.width = (byte(pos + 7) << 8) | byte(pos + 8);
      image.components = byte(pos + 9);
      if (image.width <= 0 || image.height <= 0) {
        error = "JPEG frame has no size: " + path.string();
        return false;
      }
      return true;
    }
    if (marker == 0xD9 || marker == 0xDA)
      break;
    pos += 2 + length;
  }
  error = "JPEG frame header not found: " + path.string();
  return false;
}

size_t AppendImageObject(std::vector<PdfObject> &objects,
                         const JpegImage &image) {
  const char *colorSpace = "/DeviceRGB";
  if (image.components == 1)
    colorSpace = "/DeviceGray";
  else if (image.components == 4)
    colorSpace = "/DeviceCMYK";

  std::ostringstream obj;
  obj << "<< /Type /XObject /Subtype /Image /Width " << image.width
      << " /Height " << image.height << " /ColorSpace " << colorSpace
      << " /BitsPerComponent 8 /Filter /DCTDecode";
  // Adobe CMYK JPEGs are stored inverted.
  if (image.components == 4)
    obj << " /Decode [1 0 1 0 1 0 1 0]";
  obj << " /Length " << image.data.size() << " >>\nstream\n"
      << image.data << "\nendstream";
  objects.push_back({obj.str()});
  return objects.size();
}

} // namespace pdf
} // namespace spellscribe
