#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace finbot_core {

// Fixed set of open connections to the knowledge database, shared by request threads
class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, int pool_size);

    // Blocks until a connection is free
    std::unique_ptr<sqlite::database> get_connection();

    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    size_t available() const;

private:
    bool shutting_down_ = false;
    std::string db_path_;
    std::queue<std::unique_ptr<sqlite::database>> pool_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace finbot_core
