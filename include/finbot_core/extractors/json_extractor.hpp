#pragma once

#include "content_extractor.hpp"

namespace finbot_core {

// Accepts {"categories": [{"category", "questions": [{"question", "answer"}]}]} and flat
// arrays of {"category", "question", "answer"} objects. Entries missing a question or
// an answer are skipped.
class JsonExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;

    std::vector<ExtractedDocument> extract_from_string(
        const std::string& content, const std::string& default_category) const override;
};

}  // namespace finbot_core
