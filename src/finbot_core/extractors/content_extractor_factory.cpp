#include "finbot_core/extractors/content_extractor_factory.hpp"
#include "finbot_core/extractors/delimited_text_extractor.hpp"
#include "finbot_core/extractors/json_extractor.hpp"
#include "finbot_core/extractors/plaintext_extractor.hpp"

namespace finbot_core {
ContentExtractorFactory::ContentExtractorFactory() {
    extractors_.push_back(std::make_unique<JsonExtractor>());
    extractors_.push_back(std::make_unique<DelimitedTextExtractor>());
    extractors_.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
    for (const auto& extractor : extractors_) {
        if (extractor->can_handle(file_path)) {
            return *extractor;
        }
    }
    throw ContentExtractorError("Unsupported file format: " + file_path.filename().string());
}

bool ContentExtractorFactory::is_supported(const std::filesystem::path& file_path) const {
    for (const auto& extractor : extractors_) {
        if (extractor->can_handle(file_path)) {
            return true;
        }
    }
    return false;
}

const std::vector<std::string>& ContentExtractorFactory::supported_extensions() {
    static const std::vector<std::string> extensions = {".json", ".csv", ".tsv", ".txt"};
    return extensions;
}
}  // namespace finbot_core
