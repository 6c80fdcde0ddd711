#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

namespace vault_core {

// Coarse grouping of SQLite result codes for error messages.
enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  Full,
  Corrupt,
  Schema,
  Generic
};

inline DbErrorKind classify_sqlite_error(const sqlite::sqlite_exception& e) {
  // Extended codes carry the primary code in their low byte
  switch (e.get_code() & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return DbErrorKind::Corrupt;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline const char* describe_db_error(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "collection is locked by another writer";
    case DbErrorKind::Constraint: return "record violates a storage constraint";
    case DbErrorKind::Readonly: return "storage root is read-only";
    case DbErrorKind::Io: return "disk I/O error";
    case DbErrorKind::CantOpen: return "cannot open collection database";
    case DbErrorKind::Full: return "disk is full";
    case DbErrorKind::Corrupt: return "collection database is damaged or not a collection";
    case DbErrorKind::Schema: return "unexpected collection schema";
    default: return "storage error";
  }
}

// "<operation>: <description> (<sqlite message>) [code=N, xcode=M]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  std::string msg = operation + ": " + describe_db_error(classify_sqlite_error(e)) + " (" +
                    e.errstr() + ")";
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return msg;
}

} // namespace vault_core
