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
#include "line_wrapper.h"

#include "stringutils.h"

namespace spellscribe {

std::vector<std::string> WrapTokens(const std::vector<std::string> &tokens,
                                    double width, Style style, double size,
                                    const MetricsAdapter &metrics,
                                    EscapeMode mode, double firstLineWidth) {
  std::vector<std::string> lines;
  const bool shortFirstLine = firstLineWidth >= 0.0 && firstLineWidth < width;
  double limit = shortFirstLine ? firstLineWidth : width;
  std::string current;
  for (const auto &token : tokens) {
    const std::string word = mode == EscapeMode::Resolve
                                 ? StringUtils::StripLeadingEscape(token)
                                 : token;
    if (current.empty()) {
      if (lines.empty() && shortFirstLine &&
          metrics.Width(word, style, size) > limit) {
        lines.emplace_back();
        limit = width;
      }
      current = word;
      continue;
    }
    std::string candidate = current + " " + word;
    if (metrics.Width(candidate, style, size) <= limit) {
      current = std::move(candidate);
    } else {
      lines.push_back(std::move(current));
      current = word;
      limit = width;
    }
  }
  if (!current.empty())
    lines.push_back(std::move(current));
  return lines;
}

std::vector<std::string> WrapText(const std::string &text, double width,
                                  Style style, double size,
                                  const MetricsAdapter &metrics,
                                  EscapeMode mode, double firstLineWidth) {
  return WrapTokens(StringUtils::SplitWhitespace(text), width, style, size,
                    metrics, mode, firstLineWidth);
}

} // namespace spellscribe
