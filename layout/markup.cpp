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
#include "markup.h"

#include "stringutils.h"

#include <cctype>

namespace spellscribe {

namespace {

const char *const kTableTag = "<table>";
const char *const kTableReferencePrefix = "[table][";

bool ParseStyleTag(const std::string &token, Style &style) {
  if (token == "<r>")
    style = Style::Regular;
  else if (token == "<b>")
    style = Style::Bold;
  else if (token == "<i>")
    style = Style::Italic;
  else if (token == "<bi>" || token == "<ib>")
    style = Style::BoldItalic;
  else
    return false;
  return true;
}

bool ParseTableReference(const std::string &token, size_t tableCount,
                         size_t &index) {
  const std::string prefix = kTableReferencePrefix;
  if (token.size() <= prefix.size() + 1 ||
      token.compare(0, prefix.size(), prefix) != 0 || token.back() != ']')
    return false;
  const std::string digits =
      token.substr(prefix.size(), token.size() - prefix.size() - 1);
  if (digits.empty() || digits.size() > 9)
    return false;
  for (char ch : digits) {
    if (!std::isdigit(static_cast<unsigned char>(ch)))
      return false;
  }
  index = static_cast<size_t>(std::stoul(digits));
  return index < tableCount;
}

// Literal text of a token, as collected into a table.
std::string RawText(const MarkupToken &token) {
  if (auto style = std::get_if<markup::StyleChange>(&token))
    return style->tag;
  if (auto toggle = std::get_if<markup::TableToggle>(&token))
    return toggle->tag;
  if (auto reference = std::get_if<markup::TableReference>(&token))
    return reference->tag;
  if (auto escaped = std::get_if<markup::Escaped>(&token))
    return escaped->raw;
  if (auto plain = std::get_if<markup::Plain>(&token))
    return plain->text;
  return {};
}

} // namespace

std::vector<MarkupToken> TokenizeMarkup(const std::string &text,
                                        size_t tableCount) {
  std::vector<MarkupToken> out;
  const std::vector<std::string> paragraphs = StringUtils::SplitLines(text);
  for (size_t i = 0; i < paragraphs.size(); ++i) {
    if (i > 0)
      out.emplace_back(markup::ParagraphEnd{});
    const std::vector<std::string> tokens =
        StringUtils::SplitWhitespace(paragraphs[i]);
    for (size_t k = 0; k < tokens.size(); ++k) {
      const std::string &token = tokens[k];
      Style style = Style::Regular;
      size_t index = 0;
      if (ParseStyleTag(token, style))
        out.emplace_back(markup::StyleChange{style, token});
      else if (token == kTableTag)
        out.emplace_back(markup::TableToggle{token});
      else if (k == 0 && ParseTableReference(token, tableCount, index))
        out.emplace_back(markup::TableReference{index, token});
      else if (StringUtils::IsEscaped(token))
        out.emplace_back(markup::Escaped{token});
      else
        out.emplace_back(markup::Plain{token});
    }
  }
  return out;
}

MarkupWriter::MarkupWriter(Document &document, TextFlowEngine &flow,
                           TableLayoutEngine &tables,
                           const TableOptions &options)
    : document_(document), flow_(flow), tables_(tables), options_(options) {}

void MarkupWriter::Write(LayoutContext &context, const std::string &text,
                         Style startStyle, TextClass textClass,
                         const std::vector<ParsedTable> &tables) {
  if (context.region.IsDegenerate())
    return;
  Run run{context, textClass};
  run.style = startStyle;
  // A block opening at the left edge starts a paragraph.
  if (!context.hasContent && context.cursor.x <= context.region.xMin)
    context.paragraphStart = true;

  for (const MarkupToken &token : TokenizeMarkup(text, tables.size())) {
    // The rest of a paragraph holding a record table reference is dropped.
    if (run.skipParagraph) {
      if (std::holds_alternative<markup::ParagraphEnd>(token))
        run.skipParagraph = false;
      else
        continue;
    }
    if (run.state == State::CollectingTable) {
      if (std::holds_alternative<markup::TableToggle>(token))
        EndTable(run, ParseTableTokens(run.tableTokens));
      else if (!std::holds_alternative<markup::ParagraphEnd>(token))
        run.tableTokens.push_back(RawText(token));
      continue;
    }

    if (auto change = std::get_if<markup::StyleChange>(&token)) {
      ChangeStyle(run, change->style);
    } else if (std::holds_alternative<markup::TableToggle>(token)) {
      BeginTable(run);
      run.state = State::CollectingTable;
    } else if (auto reference = std::get_if<markup::TableReference>(&token)) {
      BeginTable(run);
      EndTable(run, tables[reference->index]);
      run.skipParagraph = true;
    } else if (auto escaped = std::get_if<markup::Escaped>(&token)) {
      Append(run, escaped->raw);
    } else if (auto plain = std::get_if<markup::Plain>(&token)) {
      Append(run, plain->text);
    } else if (!run.buffer.empty() || !context.paragraphStart) {
      // After a table the cursor already sits on a new paragraph line.
      run.buffer.push_back('\n');
    }
  }

  // An unclosed table still gets laid out.
  if (run.state == State::CollectingTable) {
    EndTable(run, ParseTableTokens(run.tableTokens));
  } else {
    bool paragraphBreak = false;
    Flush(run, paragraphBreak);
  }
}

void MarkupWriter::Append(Run &run, const std::string &token) {
  if (!run.buffer.empty() && run.buffer.back() != '\n')
    run.buffer.push_back(' ');
  run.buffer += token;
}

bool MarkupWriter::Flush(Run &run, bool &paragraphBreak) {
  std::string text;
  text.swap(run.buffer);
  const size_t last = text.find_last_not_of(" \n");
  if (last == std::string::npos) {
    paragraphBreak = text.find('\n') != std::string::npos;
    return false;
  }
  paragraphBreak = text.find('\n', last) != std::string::npos;
  text.resize(last + 1);
  flow_.Flow(run.context, text, run.style, run.textClass);
  return true;
}

void MarkupWriter::ChangeStyle(Run &run, Style style) {
  LayoutContext &context = run.context;
  const MetricsAdapter &metrics = document_.Metrics();
  bool paragraphBreak = false;
  const bool drew = Flush(run, paragraphBreak);
  if (paragraphBreak && context.hasContent) {
    PageCursor cursor(context, document_);
    cursor.Newline(metrics.Newline(run.textClass));
    context.cursor.x = context.region.xMin + metrics.TabAmount();
    context.lineStartX = context.region.xMin;
    context.paragraphStart = true;
  } else if (drew) {
    context.cursor.x += metrics.SpaceWidth(run.style, run.textClass);
  }
  run.style = style;
}

void MarkupWriter::BeginTable(Run &run) {
  LayoutContext &context = run.context;
  bool paragraphBreak = false;
  Flush(run, paragraphBreak);
  if (context.hasContent)
    context.cursor.y -= document_.Metrics().Newline(run.textClass);
  context.cursor.y -= options_.outerVerticalMargin;
  run.tableTokens.clear();
}

void MarkupWriter::EndTable(Run &run, const ParsedTable &table) {
  LayoutContext &context = run.context;
  tables_.Layout(context, table);
  context.cursor.y -=
      options_.outerVerticalMargin + document_.Metrics().Newline(run.textClass);
  context.cursor.x = context.region.xMin;
  context.lineStartX = context.region.xMin;
  context.paragraphStart = true;
  context.inBulletList = false;
  run.style = Style::Regular;
  run.state = State::Text;
  run.tableTokens.clear();
}

} // namespace spellscribe
