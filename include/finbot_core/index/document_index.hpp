#pragma once

#include <exception>
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "finbot_core/types/chunk.hpp"

namespace finbot_core {

class EmbeddingProvider;

class DocumentIndexError : public std::exception {
 public:
  explicit DocumentIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised by search() when nothing has been indexed yet. Callers treat it as
// "no relevant context".
class EmptyIndexError : public DocumentIndexError {
 public:
  explicit EmptyIndexError(const std::string &message) : DocumentIndexError(message) {}
};

class DimensionMismatchError : public DocumentIndexError {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : DocumentIndexError("Vector dimension mismatch. Expected " + std::to_string(expected) +
                           ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

/**
 * @class DocumentIndex
 * @brief Owns every Chunk of the knowledge base and answers exact cosine k-NN queries.
 *
 * Vectors are L2-normalised on the way in and stored in an exact inner-product Faiss
 * index, so the inner product it returns is the cosine similarity. Reads take a shared
 * lock and run in parallel; insert/bulk_insert/remove take the exclusive lock, so a
 * search sees either all or none of a batch.
 */
class DocumentIndex {
 public:
  /**
   * @param dimension Fixed embedding length for every chunk in the index.
   * @param embedding_provider Used to embed chunks that arrive without an embedding.
   *        May be null, in which case such chunks are rejected.
   */
  DocumentIndex(size_t dimension, std::shared_ptr<EmbeddingProvider> embedding_provider = nullptr);
  ~DocumentIndex();

  DocumentIndex(const DocumentIndex &) = delete;
  DocumentIndex &operator=(const DocumentIndex &) = delete;
  DocumentIndex(DocumentIndex &&) = delete;
  DocumentIndex &operator=(DocumentIndex &&) = delete;

  // Assigns an id when chunk.id == 0, embeds the text when the chunk carries no
  // embedding, validates the dimension. Returns the chunk as stored.
  ChunkPtr insert(Chunk chunk);

  // All-or-nothing version of insert(). Every chunk is validated before the index is
  // touched; readers never observe a partially applied batch.
  std::vector<ChunkPtr> bulk_insert(std::vector<Chunk> chunks);

  // Removes the given ids; unknown ids are ignored. Returns the number removed.
  size_t remove(const std::vector<int64_t> &ids);

  // Top-k by cosine similarity, sorted descending. Ties go to the earliest created_at,
  // then to the lowest id.
  // @throws EmptyIndexError when the index holds no chunks
  // @throws DimensionMismatchError when the query has the wrong length
  std::vector<ScoredChunk> search(const std::vector<float> &query_embedding, size_t k) const;

  ChunkPtr get(int64_t id) const;
  bool contains_content_hash(const std::string &content_hash) const;

  size_t size() const;
  bool empty() const;
  size_t dimension() const {
    return dimension_;
  }

  static float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

 private:
  size_t dimension_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  std::unordered_map<int64_t, ChunkPtr> chunks_;
  std::unordered_map<std::string, int64_t> ids_by_hash_;
  int64_t next_id_ = 1;

  // Runs outside the lock: embedding calls can be slow
  void prepare(Chunk &chunk) const;
  void validate_dimension(const std::vector<float> &vector) const;
  std::vector<float> normalized(const std::vector<float> &vector) const;
  static bool ranks_before(const ScoredChunk &a, const ScoredChunk &b);
};

}  // namespace finbot_core
