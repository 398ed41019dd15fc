#pragma once

#include "spell.h"
#include "spellbookconfig.h"

#include <filesystem>
#include <string>
#include <vector>

namespace spellscribe {

struct ExportResult {
  bool success = false;
  std::string message;
};

// Lays out a title page followed by one section per spell, in the given
// order, and writes the PDF to `output`.
ExportResult CreateSpellbook(const std::string &title,
                             const std::vector<Spell> &spells,
                             const SpellbookConfig &config,
                             const std::filesystem::path &output);

} // namespace spellscribe
