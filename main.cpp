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
#include "errors.h"
#include "logger.h"
#include "pdf_font_metrics.h"
#include "spellbook_export.h"
#include "spellbookconfig.h"
#include "spellio.h"

#include <getopt.h>

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace spellscribe;

namespace {

void PrintUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " -s <spell folder> -o <output.pdf> [-c config.json]"
               " [-t title] [-l logfile]\n"
               "  -s, --spells   folder of spell JSON files\n"
               "  -o, --output   PDF file to write\n"
               "  -c, --config   layout configuration file\n"
               "  -t, --title    title page text (default \"Spellbook\")\n"
               "  -l, --log      log file (default spellscribe.log)\n";
}

FontPaths SystemFonts() {
  FontPaths fonts;
  fonts.regular = pdf::FindSystemFontPath(Style::Regular).string();
  fonts.bold = pdf::FindSystemFontPath(Style::Bold).string();
  fonts.italic = pdf::FindSystemFontPath(Style::Italic).string();
  fonts.boldItalic = pdf::FindSystemFontPath(Style::BoldItalic).string();
  return fonts;
}

int Fail(const std::string &message) {
  Logger::Instance().Log(LogLevel::Error, message);
  Logger::Instance().Flush();
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  static const struct option longOptions[] = {
      {"spells", required_argument, nullptr, 's'},
      {"output", required_argument, nullptr, 'o'},
      {"config", required_argument, nullptr, 'c'},
      {"title", required_argument, nullptr, 't'},
      {"log", required_argument, nullptr, 'l'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  std::string spellFolder;
  std::string outputPath;
  std::string configPath;
  std::string title;
  int c;
  while ((c = getopt_long(argc, argv, "s:o:c:t:l:h", longOptions, nullptr)) !=
         -1) {
    switch (c) {
    case 's':
      spellFolder = optarg;
      break;
    case 'o':
      outputPath = optarg;
      break;
    case 'c':
      configPath = optarg;
      break;
    case 't':
      title = optarg;
      break;
    case 'l':
      Logger::SetLogFile(optarg);
      break;
    case 'h':
      PrintUsage(argv[0]);
      return 0;
    default:
      PrintUsage(argv[0]);
      return 1;
    }
  }
  if (spellFolder.empty() || outputPath.empty() || optind < argc) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::optional<SpellbookConfig> config;
  try {
    if (configPath.empty())
      config.emplace(SpellbookConfig::WithDefaults(SystemFonts()));
    else
      config.emplace(LoadSpellbookConfig(configPath));
  } catch (const ConfigurationError &e) {
    return Fail(std::string("Configuration error: ") + e.what());
  }

  std::vector<Spell> spells;
  std::string error;
  if (!LoadSpellsFromFolder(spellFolder, spells, error))
    return Fail(error);
  Logger::Instance().Log("Loaded " + std::to_string(spells.size()) +
                         " spells from " + spellFolder);

  ExportResult result = CreateSpellbook(title, spells, *config, outputPath);
  Logger::Instance().Flush();
  return result.success ? 0 : 1;
}
