#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "content_extractor.hpp"

namespace finbot_core {

/**
 * @class ContentExtractorFactory
 * @brief Picks the ContentExtractor for an uploaded or bootstrap file by extension.
 *
 * Supported: .json, .csv, .tsv, .txt. Non-copyable and non-movable.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();

  /**
   * @throw ContentExtractorError if no extractor handles the file
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  bool is_supported(const std::filesystem::path& file_path) const;

  // e.g. {".json", ".csv", ".tsv", ".txt"}
  static const std::vector<std::string>& supported_extensions();

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors_;
};
}  // namespace finbot_core
