#pragma once

#include "finbot_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace finbot_core {

class DatabaseManager {
public:
    static DatabaseManager& get_instance();

    // Must be called once at application startup. Creates the parent directory and the
    // schema when missing.
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // Used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const { return is_initialized_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    DatabaseManager() = default;
    void setup_schema(const std::filesystem::path& db_path);

    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace finbot_core
