#pragma once
#include "finbot_core/db/database_manager.hpp"
#include <sqlite_modern_cpp.h>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace finbot_core {

// Borrows a knowledge database connection for the lifetime of the guard
class PooledConnection {
public:
    explicit PooledConnection(DatabaseManager& manager)
        : manager_(manager), conn_(manager.get_connection()) {
        if (!conn_) {
            throw std::runtime_error("Knowledge database connection unavailable: pool is shutting down");
        }
    }

    ~PooledConnection() {
        if (conn_) {
            manager_.return_connection(std::move(conn_));
        }
    }

    sqlite::database* operator->() const { return conn_.get(); }
    sqlite::database& operator*() const { return *conn_; }

    // Runs body inside BEGIN IMMEDIATE ... COMMIT. Anything body throws rolls the
    // transaction back and is rethrown unchanged.
    template <typename Body>
    void write_transaction(Body&& body) {
        *conn_ << "BEGIN IMMEDIATE;";
        try {
            body(*conn_);
            *conn_ << "COMMIT;";
        } catch (...) {
            rollback();
            throw;
        }
    }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

private:
    DatabaseManager& manager_;
    std::unique_ptr<sqlite::database> conn_;

    void rollback() noexcept {
        try {
            *conn_ << "ROLLBACK;";
        } catch (const sqlite::sqlite_exception& e) {
            std::cerr << "[ChunkRepository] Rollback failed: " << e.what() << std::endl;
        }
    }
};
}  // namespace finbot_core
