#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "finbot_core/extractors/content_extractor_factory.hpp"

namespace finbot_core {

class ChunkRepository;
class DocumentIndex;
class EmbeddingProvider;
class SensitiveDataRedactor;

struct IngestionResult {
  bool success = false;
  std::string message;
  size_t document_count = 0;

  nlohmann::json to_json() const {
    return {{"success", success}, {"message", message}, {"document_count", document_count}};
  }
};

/**
 * @class IngestionService
 * @brief The only writer of the knowledge base.
 *
 * Extracts documents, normalises and redacts them, drops duplicates by content hash,
 * embeds them and inserts each file as one batch. The batch is then mirrored to the
 * chunk repository; if that write fails the batch is removed from the index again so
 * the two never disagree. Calls are serialized.
 */
class IngestionService {
 public:
  static constexpr const char *kManualSource = "manual_addition";

  IngestionService(std::shared_ptr<DocumentIndex> document_index,
                   std::shared_ptr<EmbeddingProvider> embedding_provider,
                   std::shared_ptr<ChunkRepository> chunk_repository,
                   std::shared_ptr<const SensitiveDataRedactor> redactor = nullptr);

  // Source "manual_addition", text "Question: <q>\nAnswer: <a>"
  IngestionResult add_document(const std::string &category,
                               const std::string &question,
                               const std::string &answer);

  // Source is the file name
  // @throws ContentExtractorError for unsupported or malformed files
  IngestionResult ingest_file(const std::filesystem::path &file_path);

  IngestionResult ingest_documents(const std::vector<ExtractedDocument> &documents,
                                   const std::string &source);

  // Loads every mirrored chunk into the index with its original id and timestamp
  size_t restore_from_repository();

  // Ingests every supported file of the directory, in name order. Files that fail are
  // logged and skipped.
  size_t bootstrap_from_directory(const std::filesystem::path &directory);

  const ContentExtractorFactory &extractor_factory() const {
    return extractor_factory_;
  }

 private:
  std::shared_ptr<DocumentIndex> document_index_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<ChunkRepository> chunk_repository_;
  std::shared_ptr<const SensitiveDataRedactor> redactor_;
  ContentExtractorFactory extractor_factory_;
  std::mutex ingest_mutex_;

  IngestionResult ingest_locked(const std::vector<ExtractedDocument> &documents,
                                const std::string &source);
};

}  // namespace finbot_core
