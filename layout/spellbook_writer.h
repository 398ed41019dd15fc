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

#include "document.h"
#include "markup.h"
#include "page_cursor.h"
#include "spell.h"
#include "spellbookconfig.h"
#include "table_layout.h"
#include "text_flow.h"

#include <string>

namespace spellscribe {

// Writes the title page and one section per spell into a document.
class SpellbookWriter {
public:
  SpellbookWriter(Document &document, const SpellbookConfig &config);

  // Unnumbered page with the title centered on it.
  void WriteTitlePage(const std::string &title);

  // Starts a new page and writes the spell's header block followed by its
  // description. Long descriptions continue on further pages.
  void WriteSpell(const Spell &spell);

private:
  // Context for the next field, `advance` below where `previous` ended.
  LayoutContext NextField(const LayoutContext &previous, double advance) const;
  void WriteLabeled(LayoutContext &context, const std::string &label,
                    const std::string &value);

  Document &document_;
  TextFlowEngine flow_;
  TableLayoutEngine tables_;
  MarkupWriter markup_;
};

} // namespace spellscribe
