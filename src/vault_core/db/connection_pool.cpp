#include "vault_core/db/connection_pool.hpp"

#include "vault_core/errors.hpp"

namespace vault_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size,
                               const Configurer& configure)
    : db_path_(db_path), capacity_(pool_size > 0 ? static_cast<size_t>(pool_size) : 1) {
  idle_.reserve(capacity_);
  for (size_t i = 0; i < capacity_; ++i) {
    auto db = std::make_unique<sqlite::database>(db_path_);
    if (configure) {
      configure(*db);
    }
    idle_.push_back(std::move(db));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !idle_.empty(); });

  if (shutting_down_) {
    throw NotOpenError("Database access");
  }

  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_ || !conn) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    idle_.clear();
  }
  cv_.notify_all();
}

size_t ConnectionPool::idle_count() {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace vault_core
