#include "finbot_core/db/chunk_repository.hpp"

#include <cstring>
#include <iostream>

#include "finbot_core/db/pooled_connection.hpp"
#include "finbot_core/db/sqlite_error_utils.hpp"
#include "finbot_core/services/compression_service.hpp"

namespace finbot_core {

ChunkRepository::ChunkRepository(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::vector<char> ChunkRepository::embedding_to_blob(const std::vector<float> &embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  std::memcpy(blob.data(), embedding.data(), blob.size());
  return blob;
}

std::vector<float> ChunkRepository::blob_to_embedding(const std::vector<char> &blob) {
  if (blob.size() % sizeof(float) != 0) {
    throw ChunkRepositoryError("Embedding blob of " + std::to_string(blob.size()) +
                               " bytes is not a float vector");
  }
  std::vector<float> embedding(blob.size() / sizeof(float));
  std::memcpy(embedding.data(), blob.data(), blob.size());
  return embedding;
}

int64_t ChunkRepository::to_epoch_ms(const std::chrono::system_clock::time_point &tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point ChunkRepository::from_epoch_ms(int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(ms)));
}

void ChunkRepository::save_chunks(const std::vector<ChunkPtr> &chunks) {
  if (chunks.empty())
    return;

  try {
    PooledConnection conn(db_manager_);
    conn.write_transaction([&](sqlite::database &db) {
      for (const auto &chunk : chunks) {
        std::vector<char> content = CompressionService::compress(chunk->text);
        std::vector<char> embedding = embedding_to_blob(chunk->embedding);
        db << "INSERT INTO chunks (id, content, content_hash, category, source, embedding, "
              "created_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
           << chunk->id << content << chunk->content_hash << chunk->category << chunk->source
           << embedding << to_epoch_ms(chunk->created_at);
      }
    });
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkRepositoryError(format_db_error("save_chunks", e));
  } catch (const CompressionError &e) {
    throw ChunkRepositoryError("save_chunks failed: " + std::string(e.what()));
  }
}

size_t ChunkRepository::remove_chunks(const std::vector<int64_t> &ids) {
  if (ids.empty())
    return 0;

  size_t removed = 0;
  try {
    PooledConnection conn(db_manager_);
    conn.write_transaction([&](sqlite::database &db) {
      for (int64_t id : ids) {
        db << "DELETE FROM chunks WHERE id = ?" << id;
        removed += static_cast<size_t>(db.rows_modified());
      }
    });
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkRepositoryError(format_db_error("remove_chunks", e));
  }
  return removed;
}

std::vector<Chunk> ChunkRepository::load_all() {
  std::vector<Chunk> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, content, content_hash, category, source, embedding, created_at "
             "FROM chunks ORDER BY id" >>
        [&](int64_t id, std::vector<char> content, std::string content_hash, std::string category,
            std::string source, std::vector<char> embedding, int64_t created_at) {
          Chunk chunk;
          chunk.id = id;
          chunk.text = CompressionService::decompress(content);
          chunk.content_hash = std::move(content_hash);
          chunk.category = std::move(category);
          chunk.source = std::move(source);
          chunk.embedding = blob_to_embedding(embedding);
          chunk.created_at = from_epoch_ms(created_at);
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkRepositoryError(format_db_error("load_all", e));
  } catch (const CompressionError &e) {
    throw ChunkRepositoryError("load_all failed: " + std::string(e.what()));
  }
  return chunks;
}

size_t ChunkRepository::count() {
  try {
    PooledConnection conn(db_manager_);
    int64_t total = 0;
    *conn << "SELECT COUNT(*) FROM chunks" >> total;
    return static_cast<size_t>(total);
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkRepositoryError(format_db_error("count", e));
  }
}

}  // namespace finbot_core
