#pragma once

#include "vault_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace vault_core {

// Owns the SQLite file behind one collection: schema setup plus the
// connection pool used by CollectionStore.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the file and schema if needed. Throws StorageError when the
    // file exists but is not a healthy SQLite database.
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const { return is_initialized_; }
    const std::filesystem::path& db_path() const { return db_path_; }

    // Pragmas applied to every connection.
    static void configure_connection(sqlite::database& db);

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path);

    std::unique_ptr<ConnectionPool> pool_;
    std::filesystem::path db_path_;
    bool is_initialized_ = false;
};

} // namespace vault_core
