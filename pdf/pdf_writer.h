#pragma once

#include "pdf_objects.h"

#include <filesystem>
#include <string>
#include <vector>

namespace spellscribe {
namespace pdf {

// Writes objects numbered from 1 in order, then the xref table and trailer.
// `infoObjectIndex` may be 0 for no document information dictionary.
bool WritePdfDocument(const std::filesystem::path &outputPath,
                      const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, size_t infoObjectIndex,
                      std::string &error);

} // namespace pdf
} // namespace spellscribe
