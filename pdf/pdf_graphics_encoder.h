#pragma once

#include "pdf_objects.h"
#include "typography.h"

#include <sstream>
#include <string>

namespace spellscribe {
namespace pdf {

struct Point {
  double x = 0.0;
  double y = 0.0;
};

// Emits color and line width operators only when they change.
class GraphicsStateCache {
public:
  void SetStroke(std::ostringstream &out, const Color &color, double width,
                 const FloatFormatter &fmt);
  void SetFill(std::ostringstream &out, const Color &color,
               const FloatFormatter &fmt);

private:
  static bool SameColor(const Color &a, const Color &b);
  Color strokeColor_{};
  Color fillColor_{};
  double lineWidth_ = -1.0;
  bool hasStrokeColor_ = false;
  bool hasFillColor_ = false;
  bool hasLineWidth_ = false;
  bool capStyleSet_ = false;
};

// Escapes '(', ')' and '\' for a PDF literal string.
std::string EscapePdfString(const std::string &bytes);

void AppendLine(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &a, const Point &b,
                const Color &color, double width);

// `encoded` is WinAnsi text.
void AppendText(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &position,
                const std::string &fontKey, double fontSize,
                const Color &color, const std::string &encoded);

void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const std::string &imageKey, const Point &origin,
                 double width, double height);

} // namespace pdf
} // namespace spellscribe
