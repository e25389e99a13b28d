#include "finbot_core/db/database_manager.hpp"

#include <stdexcept>

namespace finbot_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on a single connection, before the pool opens its own
  setup_schema(db_path);

  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";

  // content is zstd-compressed text, embedding the raw float vector, created_at is
  // milliseconds since the Unix epoch
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY,
          content BLOB NOT NULL,
          content_hash TEXT UNIQUE NOT NULL,
          category TEXT NOT NULL DEFAULT '',
          source TEXT NOT NULL,
          embedding BLOB NOT NULL,
          created_at INTEGER NOT NULL
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_source
      ON chunks(source)
    )";
}

}  // namespace finbot_core
