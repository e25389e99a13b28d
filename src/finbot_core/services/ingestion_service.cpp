#include "finbot_core/services/ingestion_service.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

#include "finbot_core/db/chunk_repository.hpp"
#include "finbot_core/index/document_index.hpp"
#include "finbot_core/llm/embedding_provider.hpp"
#include "finbot_core/validation/sensitive_data_redactor.hpp"

namespace finbot_core {

IngestionService::IngestionService(std::shared_ptr<DocumentIndex> document_index,
                                   std::shared_ptr<EmbeddingProvider> embedding_provider,
                                   std::shared_ptr<ChunkRepository> chunk_repository,
                                   std::shared_ptr<const SensitiveDataRedactor> redactor)
    : document_index_(std::move(document_index)),
      embedding_provider_(std::move(embedding_provider)),
      chunk_repository_(std::move(chunk_repository)),
      redactor_(std::move(redactor)) {
  if (!document_index_ || !embedding_provider_) {
    throw std::invalid_argument("IngestionService requires a document index and an embedding provider");
  }
  if (!redactor_) {
    redactor_ = std::make_shared<SensitiveDataRedactor>();
  }
}

IngestionResult IngestionService::add_document(const std::string &category,
                                               const std::string &question,
                                               const std::string &answer) {
  ExtractedDocument document{ContentExtractor::format_question_answer(question, answer), category};
  std::lock_guard<std::mutex> lock(ingest_mutex_);
  auto result = ingest_locked({document}, kManualSource);
  if (result.success && result.document_count == 1) {
    result.message = "Document added successfully";
  } else if (result.success) {
    result.success = false;
    result.message = "Document already exists";
  }
  return result;
}

IngestionResult IngestionService::ingest_file(const std::filesystem::path &file_path) {
  if (!std::filesystem::exists(file_path)) {
    return {false, "File not found: " + file_path.filename().string(), 0};
  }
  const auto &extractor = extractor_factory_.get_extractor_for(file_path);
  auto documents = extractor.extract(file_path);
  if (documents.empty()) {
    return {false, "No valid data found in file: " + file_path.filename().string(), 0};
  }
  std::lock_guard<std::mutex> lock(ingest_mutex_);
  return ingest_locked(documents, file_path.filename().string());
}

IngestionResult IngestionService::ingest_documents(const std::vector<ExtractedDocument> &documents,
                                                   const std::string &source) {
  std::lock_guard<std::mutex> lock(ingest_mutex_);
  return ingest_locked(documents, source);
}

IngestionResult IngestionService::ingest_locked(const std::vector<ExtractedDocument> &documents,
                                                const std::string &source) {
  std::vector<Chunk> chunks;
  std::unordered_set<std::string> batch_hashes;
  size_t duplicates = 0;

  for (const auto &document : documents) {
    std::string text = redactor_->redact(ContentExtractor::normalize_text(document.text)).text;
    if (text.empty()) {
      continue;
    }
    std::string hash = ContentExtractor::compute_content_hash(text);
    if (document_index_->contains_content_hash(hash) || !batch_hashes.insert(hash).second) {
      ++duplicates;
      continue;
    }
    Chunk chunk;
    chunk.text = std::move(text);
    chunk.category = document.category;
    chunk.source = source;
    chunk.content_hash = std::move(hash);
    chunks.push_back(std::move(chunk));
  }

  if (chunks.empty()) {
    if (duplicates > 0) {
      return {true, "All " + std::to_string(duplicates) + " documents from " + source +
                        " already exist", 0};
    }
    return {false, "No valid data found in " + source, 0};
  }

  // Embeddings are computed before the index takes its write lock
  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text);
  }
  auto embeddings = embedding_provider_->get_embeddings(texts);
  if (embeddings.size() != chunks.size()) {
    throw EmbeddingError("Embedding provider returned " + std::to_string(embeddings.size()) +
                         " vectors for " + std::to_string(chunks.size()) + " texts");
  }
  for (size_t i = 0; i < chunks.size(); ++i) {
    chunks[i].embedding = std::move(embeddings[i]);
  }

  auto stored = document_index_->bulk_insert(std::move(chunks));

  if (chunk_repository_) {
    try {
      chunk_repository_->save_chunks(stored);
    } catch (const ChunkRepositoryError &e) {
      std::vector<int64_t> ids;
      for (const auto &chunk : stored) {
        ids.push_back(chunk->id);
      }
      document_index_->remove(ids);
      std::cerr << "[Ingestion] Mirror write failed, rolled back " << ids.size()
                << " chunks from the index: " << e.what() << std::endl;
      throw;
    }
  }

  std::cout << "[Ingestion] Added " << stored.size() << " documents from " << source;
  if (duplicates > 0) {
    std::cout << " (" << duplicates << " duplicates skipped)";
  }
  std::cout << std::endl;

  return {true, "Successfully added " + std::to_string(stored.size()) + " documents from " + source,
          stored.size()};
}

size_t IngestionService::restore_from_repository() {
  if (!chunk_repository_) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(ingest_mutex_);
  auto chunks = chunk_repository_->load_all();
  if (chunks.empty()) {
    return 0;
  }
  auto stored = document_index_->bulk_insert(std::move(chunks));
  std::cout << "[Ingestion] Restored " << stored.size() << " chunks from the knowledge database"
            << std::endl;
  return stored.size();
}

size_t IngestionService::bootstrap_from_directory(const std::filesystem::path &directory) {
  if (!std::filesystem::is_directory(directory)) {
    std::cerr << "[Ingestion] Knowledge directory not found: " << directory << std::endl;
    return 0;
  }

  std::vector<std::filesystem::path> files;
  for (const auto &entry : std::filesystem::directory_iterator(directory)) {
    if (entry.is_regular_file() && extractor_factory_.is_supported(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  size_t total = 0;
  for (const auto &file : files) {
    try {
      auto result = ingest_file(file);
      if (!result.success) {
        std::cerr << "[Ingestion] " << result.message << std::endl;
      }
      total += result.document_count;
    } catch (const std::exception &e) {
      std::cerr << "[Ingestion] Skipping " << file.filename() << ": " << e.what() << std::endl;
    }
  }
  return total;
}

}  // namespace finbot_core
