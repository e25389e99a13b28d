#pragma once

#include <exception>
#include <cstdint>
#include <string>
#include <vector>

#include "finbot_core/db/database_manager.hpp"
#include "finbot_core/types/chunk.hpp"

namespace finbot_core {

class ChunkRepositoryError : public std::exception {
 public:
  explicit ChunkRepositoryError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class ChunkRepository
 * @brief Durable SQLite mirror of the document index.
 *
 * Rows keep the index ids and creation timestamps, so reloading at startup rebuilds an
 * index that ranks exactly like the one that was saved.
 */
class ChunkRepository {
 public:
  explicit ChunkRepository(DatabaseManager &db_manager);

  // One transaction: either every chunk is stored or none is
  void save_chunks(const std::vector<ChunkPtr> &chunks);

  size_t remove_chunks(const std::vector<int64_t> &ids);

  // Ordered by id
  std::vector<Chunk> load_all();

  size_t count();

  static std::vector<char> embedding_to_blob(const std::vector<float> &embedding);
  static std::vector<float> blob_to_embedding(const std::vector<char> &blob);
  static int64_t to_epoch_ms(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace finbot_core
