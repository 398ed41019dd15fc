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

#include "page_cursor.h"
#include "spellbookconfig.h"
#include "table_layout.h"
#include "text_flow.h"
#include "typography.h"

#include <string>
#include <variant>
#include <vector>

namespace spellscribe {

namespace markup {

// <r>, <b>, <i>, <bi> or <ib>.
struct StyleChange {
  Style style = Style::Regular;
  std::string tag;
};

// <table>, opening or closing an inline table.
struct TableToggle {
  std::string tag;
};

// [table][N] at the start of a paragraph, N indexing the record's tables.
struct TableReference {
  size_t index = 0;
  std::string tag;
};

// Token starting with an escape character. `raw` keeps the escape; it is
// removed when the text is wrapped or the table is parsed.
struct Escaped {
  std::string raw;
};

struct Plain {
  std::string text;
};

struct ParagraphEnd {};

} // namespace markup

using MarkupToken =
    std::variant<markup::StyleChange, markup::TableToggle,
                 markup::TableReference, markup::Escaped, markup::Plain,
                 markup::ParagraphEnd>;

// Splits markup into tokens. Paragraphs are separated by '\n' and produce a
// ParagraphEnd between them. Table references are recognised only when
// their index is below `tableCount`.
std::vector<MarkupToken> TokenizeMarkup(const std::string &text,
                                        size_t tableCount = 0);

// Drives text flow and table layout from a marked-up string.
class MarkupWriter {
public:
  MarkupWriter(Document &document, TextFlowEngine &flow,
               TableLayoutEngine &tables, const TableOptions &options);

  // Writes `text` starting at the context cursor. `tables` backs [table][N]
  // references and may be empty.
  void Write(LayoutContext &context, const std::string &text,
             Style startStyle, TextClass textClass,
             const std::vector<ParsedTable> &tables = {});

private:
  enum class State { Text, CollectingTable };

  struct Run {
    LayoutContext &context;
    TextClass textClass;
    State state = State::Text;
    Style style = Style::Regular;
    std::string buffer;
    std::vector<std::string> tableTokens;
    bool skipParagraph = false;
  };

  void Append(Run &run, const std::string &token);
  // Returns true when text was drawn. Sets `paragraphBreak` when the buffer
  // ended on a paragraph boundary.
  bool Flush(Run &run, bool &paragraphBreak);
  void ChangeStyle(Run &run, Style style);
  void BeginTable(Run &run);
  void EndTable(Run &run, const ParsedTable &table);

  Document &document_;
  TextFlowEngine &flow_;
  TableLayoutEngine &tables_;
  TableOptions options_;
};

} // namespace spellscribe
