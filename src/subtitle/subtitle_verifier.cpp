#include "subtitle/subtitle_verifier.hpp"

#include "match/masker.hpp"

#include <fstream>
#include <iterator>
#include <iostream>
#include <stdexcept>

namespace redline {

std::size_t verify_masked_text(const std::string& text, const std::vector<std::string>& words) {
    std::size_t hits = 0;
    for (const auto& w : words) {
        hits += count_occurrences(text, w);
    }
    return hits;
}

void verify_masked_file(const std::string& path, const TermCatalog& catalog) {
    if (catalog.empty()) {
        throw std::runtime_error("No terms configured");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open subtitle file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    const std::size_t hits = verify_masked_text(text, catalog.words());
    if (hits > 0) {
        throw std::runtime_error("Subtitle verification failed: found " + std::to_string(hits) +
                                 " occurrences of configured terms in " + path);
    }
    std::cout << "[verify] Passed: no configured terms found in " << path << "\n";
}

} // namespace redline
