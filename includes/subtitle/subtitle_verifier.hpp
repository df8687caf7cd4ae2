#pragma once

#include "catalog/term_catalog.hpp"

#include <string>
#include <vector>

namespace redline {

// Total whole-word, case-insensitive occurrences of every word in text.
std::size_t verify_masked_text(const std::string& text, const std::vector<std::string>& words);

// Throws std::runtime_error when the catalog is empty, when the file
// cannot be read, or when any configured word survives in it.
void verify_masked_file(const std::string& path, const TermCatalog& catalog);

} // namespace redline
