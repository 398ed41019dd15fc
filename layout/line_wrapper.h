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
#pragma once

#include "metrics_adapter.h"

#include <string>
#include <vector>

namespace spellscribe {

enum class EscapeMode {
  // Strip one leading escape character from each token before use.
  Resolve,
  // Tokens were already unescaped by the caller.
  Verbatim
};

// Greedy word wrap of a token stream in a single style. Lines never exceed
// `width` unless a single token is wider than that, in which case it sits
// alone on its line.
//
// `firstLineWidth` allows resuming on a partially used line. A negative value
// means the first line gets the full width. When the first token does not fit
// the shorter first line, that line is returned empty.
std::vector<std::string> WrapTokens(const std::vector<std::string> &tokens,
                                    double width, Style style, double size,
                                    const MetricsAdapter &metrics,
                                    EscapeMode mode = EscapeMode::Resolve,
                                    double firstLineWidth = -1.0);

std::vector<std::string> WrapText(const std::string &text, double width,
                                  Style style, double size,
                                  const MetricsAdapter &metrics,
                                  EscapeMode mode = EscapeMode::Resolve,
                                  double firstLineWidth = -1.0);

} // namespace spellscribe
