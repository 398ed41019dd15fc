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
#include "../core/stringutils.h"
#include <cassert>
#include <string>
#include <vector>

int main() {
  using StringUtils::NaturalLess;

  assert(NaturalLess("item2", "item10"));
  assert(!NaturalLess("item10", "item2"));

  assert(NaturalLess("item", "item2"));
  assert(!NaturalLess("item2", "item"));

  assert(NaturalLess("item2", "item02"));
  assert(!NaturalLess("item02", "item2"));

  assert(NaturalLess("alpha", "beta"));
  assert(!NaturalLess("beta", "alpha"));

  using StringUtils::SplitWhitespace;
  assert(SplitWhitespace("").empty());
  assert(SplitWhitespace(" \t\n ").empty());
  assert((SplitWhitespace("  a\tbb \n c  ") ==
          std::vector<std::string>{"a", "bb", "c"}));

  using StringUtils::SplitLines;
  assert((SplitLines("a\n\nb") == std::vector<std::string>{"a", "", "b"}));
  assert((SplitLines("") == std::vector<std::string>{""}));
  assert((SplitLines("a\n") == std::vector<std::string>{"a", ""}));

  assert(StringUtils::Join({"a", "b", "c"}, " ") == "a b c");
  assert(StringUtils::Join({}, " ").empty());
  assert(StringUtils::Trim("  x y \t") == "x y");

  using StringUtils::IsEscaped;
  using StringUtils::StripLeadingEscape;
  assert(IsEscaped("\\<b>"));
  assert(!IsEscaped("\\"));
  assert(!IsEscaped("<b>"));
  assert(StripLeadingEscape("\\<b>") == "<b>");
  assert(StripLeadingEscape("\\\\<b>") == "\\<b>");
  assert(StripLeadingEscape("\\") == "\\");

  return 0;
}
