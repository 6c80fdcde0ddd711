#pragma once
#include "vault_core/db/database_manager.hpp"
#include <sqlite_modern_cpp.h>
#include <memory>

namespace vault_core {
class PooledConnection {
public:
    // Borrows a connection from the manager's pool
    explicit PooledConnection(DatabaseManager& manager)
    : manager_(manager), conn_(manager.get_connection()) {}

    // Hands the connection back
    ~PooledConnection() {
        if (conn_) {
            manager_.return_connection(std::move(conn_));
        }
    }

    sqlite::database* operator->() const { return conn_.get(); }
    sqlite::database& operator*() const { return *conn_; }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

private:
    DatabaseManager& manager_;
    std::unique_ptr<sqlite::database> conn_;
};
}  // namespace vault_core
