#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vault_core {

// Fixed set of SQLite connections to one database file, shared by the
// readers and writers of a collection.
class ConnectionPool {
public:
    using Configurer = std::function<void(sqlite::database&)>;

    // Opens pool_size connections and runs configure on each.
    ConnectionPool(const std::string& db_path, int pool_size, const Configurer& configure);

    // Blocks until a connection is free. Throws NotOpenError after shutdown().
    std::unique_ptr<sqlite::database> get_connection();

    // Connections returned after shutdown() are closed instead of pooled.
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    size_t capacity() const { return capacity_; }
    size_t idle_count();

private:
    const std::string db_path_;
    const size_t capacity_;
    bool shutting_down_ = false;
    std::vector<std::unique_ptr<sqlite::database>> idle_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace vault_core
