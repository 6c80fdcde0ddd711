#include "vault_core/db/database_manager.hpp"

#include "vault_core/db/sqlite_error_utils.hpp"
#include "vault_core/errors.hpp"

namespace vault_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  try {
    // 1. Perform one-time schema setup before creating the pool
    setup_schema(db_path);

    // 2. Create the connection pool for readers and writers
    pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size,
                                             &DatabaseManager::configure_connection);
  } catch (const sqlite::sqlite_exception& e) {
    throw StorageError(format_db_error("open '" + db_path.string() + "'", e));
  }

  db_path_ = db_path;
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw NotOpenError("Database access");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::configure_connection(sqlite::database& db) {
  db << "PRAGMA busy_timeout = 5000;";
  db << "PRAGMA journal_mode = WAL;";
  // Committed transactions must survive a crash, not just a process exit.
  db << "PRAGMA synchronous = FULL;";
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path.string());

  // Fails with SQLITE_NOTADB for garbage files; reports damage otherwise.
  std::string integrity;
  db << "PRAGMA quick_check;" >> [&](std::string row) {
    if (integrity.empty()) {
      integrity = row;
    }
  };
  if (integrity != "ok") {
    throw StorageError("Integrity check failed for '" + db_path.string() + "': " + integrity);
  }

  configure_connection(db);

  db << R"(
      CREATE TABLE IF NOT EXISTS collection_info (
          singleton INTEGER PRIMARY KEY CHECK (singleton = 1),
          name TEXT NOT NULL,
          dimension INTEGER NOT NULL,
          reject_empty_text INTEGER NOT NULL,
          format_version INTEGER NOT NULL,
          created_at INTEGER NOT NULL,
          generation INTEGER NOT NULL DEFAULT 0
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS records (
          row_id INTEGER PRIMARY KEY AUTOINCREMENT,
          id TEXT UNIQUE NOT NULL,
          text TEXT NOT NULL,
          source_reference TEXT NOT NULL,
          metadata_json TEXT NOT NULL,
          embedding_blob BLOB NOT NULL,
          embedding_model_id TEXT NOT NULL,
          created_at INTEGER NOT NULL
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_records_source
      ON records(source_reference)
    )";
}

}  // namespace vault_core
