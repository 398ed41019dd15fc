/*
 * This file is part of Spellscribe.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Spellscribe is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Spellscribe is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Spellscribe. If not, see <https://www.gnu.org/licenses/>.
 */
#include "text_flow.h"

#include "line_wrapper.h"
#include "stringutils.h"

namespace spellscribe {

namespace {
const char *const kBulletDot = "\xE2\x80\xA2";
const char *const kBulletDash = "-";
const char *const kBulletPrefix = "\xE2\x80\xA2 ";

bool IsBulletToken(const std::string &token) {
  return token == kBulletDot || token == kBulletDash;
}
} // namespace

TextFlowEngine::TextFlowEngine(Document &document, const TextColors &colors)
    : document_(document), colors_(colors) {}

void TextFlowEngine::StartBulletBoundary(PageCursor &cursor,
                                         LayoutContext &context, bool bullet,
                                         double newline) {
  // A blank line separates a bullet list from surrounding paragraphs.
  if (bullet == context.inBulletList)
    return;
  context.inBulletList = bullet;
  if (context.hasContent)
    cursor.Newline(newline);
}

Cursor TextFlowEngine::Flow(LayoutContext &context, const std::string &text,
                            Style style, TextClass textClass) {
  const FlowRegion &region = context.region;
  if (region.IsDegenerate())
    return context.cursor;

  const MetricsAdapter &metrics = document_.Metrics();
  const double size = metrics.FontSize(textClass);
  const double newline = metrics.Newline(textClass);
  const Color &color = colors_.For(textClass);
  PageCursor cursor(context, document_);
  cursor.BeginBlock();

  const std::vector<std::string> paragraphs = StringUtils::SplitLines(text);
  for (size_t i = 0; i < paragraphs.size(); ++i) {
    std::vector<std::string> tokens =
        StringUtils::SplitWhitespace(paragraphs[i]);
    if (tokens.empty())
      continue;

    const bool newParagraph = i > 0 || context.paragraphStart;
    context.paragraphStart = false;
    if (i > 0) {
      cursor.Newline(newline);
      context.cursor.x = region.xMin + metrics.TabAmount();
    } else if (context.cursor.x > region.xMax) {
      cursor.Newline(newline);
      context.cursor.x = region.xMin + metrics.TabAmount();
      context.lineStartX = region.xMin;
    } else {
      cursor.Settle();
    }

    if (newParagraph) {
      const bool bullet = IsBulletToken(tokens.front());
      StartBulletBoundary(cursor, context, bullet, newline);
      if (bullet) {
        tokens.erase(tokens.begin());
        context.cursor.x = region.xMin;
        document_.Output().DrawText(context.CurrentPage(), context.cursor.x,
                                    context.cursor.y, kBulletPrefix, style,
                                    size, color);
        context.hasContent = true;
        context.lineStartX =
            region.xMin + metrics.Width(kBulletPrefix, style, size);
        context.cursor.x = context.lineStartX;
      } else {
        context.lineStartX = region.xMin;
      }
    }

    const std::vector<std::string> lines =
        WrapTokens(tokens, region.xMax - context.lineStartX, style, size,
                   metrics, EscapeMode::Resolve,
                   region.xMax - context.cursor.x);
    for (size_t j = 0; j < lines.size(); ++j) {
      if (j > 0) {
        cursor.Newline(newline);
        context.cursor.x = context.lineStartX;
      }
      if (lines[j].empty())
        continue;
      document_.Output().DrawText(context.CurrentPage(), context.cursor.x,
                                  context.cursor.y, lines[j], style, size,
                                  color);
      context.cursor.x += metrics.Width(lines[j], style, size);
      context.hasContent = true;
    }
  }
  return context.cursor;
}

Cursor TextFlowEngine::FlowCentered(LayoutContext &context,
                                    const std::vector<std::string> &lines,
                                    double xMin, double xMax, Style style,
                                    TextClass textClass) {
  if (context.region.IsDegenerate())
    return context.cursor;
  const MetricsAdapter &metrics = document_.Metrics();
  const double size = metrics.FontSize(textClass);
  const double newline = metrics.Newline(textClass);
  PageCursor cursor(context, document_);
  cursor.BeginBlock();
  for (const auto &line : lines) {
    cursor.AdvanceLine(newline);
    const double width = metrics.Width(line, style, size);
    context.cursor.x = xMin + (xMax - xMin - width) / 2.0;
    document_.Output().DrawText(context.CurrentPage(), context.cursor.x,
                                context.cursor.y, line, style, size,
                                colors_.For(textClass));
    context.cursor.x += width;
    context.hasContent = true;
  }
  return context.cursor;
}

} // namespace spellscribe
