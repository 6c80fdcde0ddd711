#pragma once

#include <iostream>

#include <sqlite_modern_cpp.h>

namespace vault_core {

enum class TransactionMode {
  Deferred,
  // Takes the write lock at BEGIN
  Immediate
};

// Scoped transaction. Rolls back on scope exit unless commit() succeeded.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  bool is_open() const { return open_; }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: rollback failed: " << e.errstr() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace vault_core
