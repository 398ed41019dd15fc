#include "pdf_graphics_encoder.h"

#include <cmath>

namespace spellscribe {
namespace pdf {

bool GraphicsStateCache::SameColor(const Color &a, const Color &b) {
  return std::abs(a.r - b.r) < 1e-6 && std::abs(a.g - b.g) < 1e-6 &&
         std::abs(a.b - b.b) < 1e-6;
}

void GraphicsStateCache::SetStroke(std::ostringstream &out,
                                   const Color &color, double width,
                                   const FloatFormatter &fmt) {
  if (!capStyleSet_) {
    out << "0 J\n";
    capStyleSet_ = true;
  }
  if (!hasStrokeColor_ || !SameColor(color, strokeColor_)) {
    out << fmt.Format(color.r) << ' ' << fmt.Format(color.g) << ' '
        << fmt.Format(color.b) << " RG\n";
    strokeColor_ = color;
    hasStrokeColor_ = true;
  }
  if (!hasLineWidth_ || std::abs(width - lineWidth_) > 1e-6) {
    out << fmt.Format(width) << " w\n";
    lineWidth_ = width;
    hasLineWidth_ = true;
  }
}

void GraphicsStateCache::SetFill(std::ostringstream &out, const Color &color,
                                 const FloatFormatter &fmt) {
  if (!hasFillColor_ || !SameColor(color, fillColor_)) {
    out << fmt.Format(color.r) << ' ' << fmt.Format(color.g) << ' '
        << fmt.Format(color.b) << " rg\n";
    fillColor_ = color;
    hasFillColor_ = true;
  }
}

std::string EscapePdfString(const std::string &bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (char ch : bytes) {
    if (ch == '(' || ch == ')' || ch == '\\')
      out.push_back('\\');
    out.push_back(ch);
  }
  return out;
}

void AppendLine(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &a, const Point &b,
                const Color &color, double width) {
  cache.SetStroke(out, color, width, fmt);
  out << fmt.Format(a.x) << ' ' << fmt.Format(a.y) << " m\n"
      << fmt.Format(b.x) << ' ' << fmt.Format(b.y) << " l\nS\n";
}

void AppendText(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &position,
                const std::string &fontKey, double fontSize,
                const Color &color, const std::string &encoded) {
  cache.SetFill(out, color, fmt);
  out << "BT\n/" << fontKey << ' ' << fmt.Format(fontSize) << " Tf\n"
      << fmt.Format(position.x) << ' ' << fmt.Format(position.y)
      << " Td\n(" << EscapePdfString(encoded) << ") Tj\nET\n";
}

void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const std::string &imageKey, const Point &origin,
                 double width, double height) {
  out << "q\n"
      << fmt.Format(width) << " 0 0 " << fmt.Format(height) << ' '
      << fmt.Format(origin.x) << ' ' << fmt.Format(origin.y) << " cm\n/"
      << imageKey << " Do\nQ\n";
}

} // namespace pdf
} // namespace spellscribe
