#pragma once

#include "content_extractor.hpp"

namespace finbot_core {

class PlainTextExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;

    std::vector<ExtractedDocument> extract_from_string(
        const std::string& content, const std::string& default_category) const override;
};

}  // namespace finbot_core
