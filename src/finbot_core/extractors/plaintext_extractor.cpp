#include "finbot_core/extractors/plaintext_extractor.hpp"
#include <regex>

namespace finbot_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
    return lower_extension(file_path) == ".txt";
}

/**
 * @brief Splits a text document into knowledge base passages.
 *
 * Paragraphs (separated by one or more blank lines) are merged until they reach
 * MIN_CHUNK_SIZE; a merged passage longer than MAX_CHUNK_SIZE is cut into overlapping
 * fixed-size windows instead.
 */
std::vector<ExtractedDocument> PlainTextExtractor::extract_from_string(
    const std::string& content, const std::string& default_category) const {
    // Passages go through normalize_text, which repairs the encoding before windowing
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    const std::regex paragraph_regex(R"(\n\s*\n)");

    std::vector<long> split_points;
    split_points.push_back(0);
    auto sections_begin = std::sregex_iterator(content.begin(), content.end(), paragraph_regex);
    for (auto i = sections_begin; i != std::sregex_iterator(); ++i) {
        split_points.push_back(i->position() + i->length());
    }
    split_points.push_back(static_cast<long>(content.length()));

    std::vector<ExtractedDocument> documents;
    std::string merged;
    for (size_t i = 0; i + 1 < split_points.size(); ++i) {
        long start = split_points[i];
        long length = split_points[i + 1] - start;
        if (length <= 0) continue;

        merged += content.substr(start, length);

        bool last_section = i + 2 == split_points.size();
        if (merged.length() < MIN_CHUNK_SIZE && !last_section) {
            continue;
        }

        std::string passage = normalize_text(merged);
        merged.clear();
        if (passage.empty()) {
            continue;
        }
        if (passage.length() > MAX_CHUNK_SIZE) {
            for (auto& window : split_into_fixed_chunks(passage)) {
                documents.push_back({std::move(window), default_category});
            }
        } else {
            documents.push_back({std::move(passage), default_category});
        }
    }
    return documents;
}

} // namespace finbot_core
