#include "vault_core/db/collection_store.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>

#include "vault_core/db/pooled_connection.hpp"
#include "vault_core/db/sqlite_error_utils.hpp"
#include "vault_core/db/transaction.hpp"
#include "vault_core/record_json.hpp"

namespace vault_core {

namespace {

constexpr const char *RECORD_COLUMNS =
    "id, text, source_reference, metadata_json, embedding_blob, embedding_model_id, created_at";

// SQLite caps bound parameters per statement.
constexpr size_t MAX_IN_CLAUSE = 500;

std::string placeholders(size_t count) {
  std::stringstream ss;
  for (size_t i = 0; i < count; ++i) {
    ss << "?";
    if (i < count - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace

RecordCursor::RecordCursor(std::shared_ptr<CollectionStore> store, int64_t max_row_id,
                           size_t page_size)
    : store_(std::move(store)), max_row_id_(max_row_id), page_size_(std::max<size_t>(page_size, 1)) {}

std::optional<Record> RecordCursor::next() {
  if (buffer_.empty() && !exhausted_) {
    auto page = store_->fetch_page(last_row_id_, max_row_id_, page_size_);
    if (page.size() < page_size_) {
      exhausted_ = true;
    }
    for (auto &entry : page) {
      buffer_.push_back(std::move(entry));
    }
  }
  if (buffer_.empty()) {
    return std::nullopt;
  }
  auto entry = std::move(buffer_.front());
  buffer_.pop_front();
  last_row_id_ = entry.first;
  return std::move(entry.second);
}

CollectionStore::CollectionStore(std::shared_ptr<DatabaseManager> db_manager,
                                 const CollectionOptions &options)
    : db_manager_(std::move(db_manager)) {
  load_or_create_descriptor(options);
}

void CollectionStore::load_or_create_descriptor(const CollectionOptions &options) {
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    bool found = false;
    *conn << "SELECT name, dimension, reject_empty_text, format_version, created_at "
             "FROM collection_info WHERE singleton = 1" >>
        [&](std::string name, int64_t dimension, int reject_empty_text, int format_version,
            int64_t created_at) {
          found = true;
          descriptor_.name = std::move(name);
          descriptor_.dimension = static_cast<size_t>(dimension);
          descriptor_.reject_empty_text = reject_empty_text != 0;
          descriptor_.format_version = format_version;
          descriptor_.created_at = from_unix_micros(created_at);
        };

    if (found) {
      if (descriptor_.format_version > FORMAT_VERSION) {
        throw StorageError("Collection format version " +
                           std::to_string(descriptor_.format_version) +
                           " is newer than supported version " + std::to_string(FORMAT_VERSION));
      }
      if (descriptor_.dimension != options.dimension) {
        throw DimensionMismatchError(descriptor_.dimension, options.dimension);
      }
      if (descriptor_.name != options.collection_name) {
        std::cerr << "Warning: opening collection '" << descriptor_.name << "' as '"
                  << options.collection_name << "'; keeping the stored name." << std::endl;
      }
      if (descriptor_.reject_empty_text != options.reject_empty_text) {
        std::cerr << "Warning: reject_empty_text is fixed at creation; collection '"
                  << descriptor_.name << "' keeps "
                  << (descriptor_.reject_empty_text ? "true" : "false") << "." << std::endl;
      }
    } else {
      int64_t existing_records = 0;
      *conn << "SELECT COUNT(*) FROM records" >> existing_records;
      if (existing_records > 0) {
        throw StorageError("Collection descriptor missing but " +
                           std::to_string(existing_records) + " records are present");
      }
      descriptor_.name = options.collection_name;
      descriptor_.dimension = options.dimension;
      descriptor_.reject_empty_text = options.reject_empty_text;
      descriptor_.format_version = FORMAT_VERSION;
      int64_t now_us = to_unix_micros(std::chrono::system_clock::now());
      descriptor_.created_at = from_unix_micros(now_us);
      *conn << "INSERT INTO collection_info (singleton, name, dimension, reject_empty_text, "
               "format_version, created_at) VALUES (1, ?, ?, ?, ?, ?)"
            << descriptor_.name << static_cast<int64_t>(descriptor_.dimension)
            << (descriptor_.reject_empty_text ? 1 : 0) << descriptor_.format_version << now_us;
    }

    *conn << "SELECT COALESCE(MAX(created_at), 0) FROM records" >> last_created_at_us_;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("load_collection_descriptor", e));
  }
}

int64_t CollectionStore::next_created_at_us() {
  int64_t now_us = to_unix_micros(std::chrono::system_clock::now());
  last_created_at_us_ = std::max(now_us, last_created_at_us_);
  return last_created_at_us_;
}

std::vector<char> CollectionStore::embedding_to_blob(const std::vector<float> &embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), embedding.data(), blob.size());
  }
  return blob;
}

std::vector<float> CollectionStore::blob_to_embedding(const std::string &id,
                                                      const std::vector<char> &blob) const {
  if (blob.size() != descriptor_.dimension * sizeof(float)) {
    throw StorageError("Corrupt embedding for record '" + id + "'. Expected " +
                       std::to_string(descriptor_.dimension * sizeof(float)) + " bytes, got " +
                       std::to_string(blob.size()) + " bytes.");
  }
  std::vector<float> embedding(descriptor_.dimension);
  std::memcpy(embedding.data(), blob.data(), blob.size());
  return embedding;
}

Record CollectionStore::row_to_record(std::string id, std::string text,
                                      std::string source_reference,
                                      const std::string &metadata_json,
                                      const std::vector<char> &embedding_blob,
                                      std::string embedding_model_id,
                                      int64_t created_at_us) const {
  Record record;
  record.embedding = blob_to_embedding(id, embedding_blob);
  try {
    record.metadata = deserialize_metadata(metadata_json);
  } catch (const std::exception &e) {
    throw StorageError("Corrupt metadata for record '" + id + "': " + e.what());
  }
  record.id = std::move(id);
  record.text = std::move(text);
  record.source_reference = std::move(source_reference);
  record.embedding_model_id = std::move(embedding_model_id);
  record.created_at = from_unix_micros(created_at_us);
  return record;
}

void CollectionStore::bump_generation(sqlite::database &db) {
  db << "UPDATE collection_info SET generation = generation + 1 WHERE singleton = 1";
}

/*
Upserts a single record inside the caller's transaction. The row_id of an
existing record is kept so index labels stay stable across replacements.
*/
WriteOutcome CollectionStore::write_record(sqlite::database &db, const Record &record,
                                           DuplicatePolicy policy) {
  int64_t existing_row = -1;
  db << "SELECT row_id FROM records WHERE id = ?" << record.id >>
      [&](int64_t row_id) { existing_row = row_id; };

  if (existing_row != -1 && policy == DuplicatePolicy::Reject) {
    throw DuplicateIdentifierError(record.id);
  }

  WriteOutcome outcome;
  int64_t created_at_us = next_created_at_us();
  outcome.created_at = from_unix_micros(created_at_us);
  std::vector<char> blob = embedding_to_blob(record.embedding);
  std::string metadata_json = serialize_metadata(record.metadata);

  if (existing_row != -1) {
    db << "UPDATE records SET text = ?, source_reference = ?, metadata_json = ?, "
          "embedding_blob = ?, embedding_model_id = ?, created_at = ? WHERE row_id = ?"
       << record.text << record.source_reference << metadata_json << blob
       << record.embedding_model_id << created_at_us << existing_row;
    outcome.row_id = existing_row;
    outcome.replaced = true;
  } else {
    db << "INSERT INTO records (id, text, source_reference, metadata_json, embedding_blob, "
          "embedding_model_id, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
       << record.id << record.text << record.source_reference << metadata_json << blob
       << record.embedding_model_id << created_at_us;
    outcome.row_id = db.last_insert_rowid();
    outcome.replaced = false;
  }
  return outcome;
}

WriteOutcome CollectionStore::put(const Record &record, DuplicatePolicy policy) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    WriteOutcome outcome = write_record(*conn, record, policy);
    bump_generation(*conn);
    tx.commit();
    return outcome;
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("put", e));
  }
}

std::vector<std::pair<size_t, WriteOutcome>> CollectionStore::put_many(
    const std::vector<const Record *> &records, DuplicatePolicy policy,
    const std::function<void(const Record &, const DuplicateIdentifierError &)> &on_rejected) {
  std::vector<std::pair<size_t, WriteOutcome>> written;
  if (records.empty()) {
    return written;
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    written.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
      try {
        written.emplace_back(i, write_record(*conn, *records[i], policy));
      } catch (const DuplicateIdentifierError &e) {
        if (on_rejected) {
          on_rejected(*records[i], e);
        }
      }
    }
    if (!written.empty()) {
      bump_generation(*conn);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("put_many", e));
  }
  return written;
}

std::optional<Record> CollectionStore::get(const std::string &id) {
  try {
    std::optional<Record> result;
    PooledConnection conn(*db_manager_);
    *conn << std::string("SELECT ") + RECORD_COLUMNS + " FROM records WHERE id = ?" << id >>
        [&](std::string id, std::string text, std::string source_reference,
            std::string metadata_json, std::vector<char> embedding_blob,
            std::string embedding_model_id, int64_t created_at) {
          result = row_to_record(std::move(id), std::move(text), std::move(source_reference),
                                 metadata_json, embedding_blob, std::move(embedding_model_id),
                                 created_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("get", e));
  }
}

std::vector<Record> CollectionStore::get_many(const std::vector<std::string> &ids) {
  std::vector<Record> records;
  if (ids.empty()) {
    return records;
  }

  try {
    PooledConnection conn(*db_manager_);
    for (size_t start = 0; start < ids.size(); start += MAX_IN_CLAUSE) {
      size_t count = std::min(MAX_IN_CLAUSE, ids.size() - start);
      auto stmt = (*conn << std::string("SELECT ") + RECORD_COLUMNS +
                                " FROM records WHERE id IN (" + placeholders(count) + ")");
      for (size_t i = start; i < start + count; ++i) {
        stmt << ids[i];
      }
      stmt >> [&](std::string id, std::string text, std::string source_reference,
                  std::string metadata_json, std::vector<char> embedding_blob,
                  std::string embedding_model_id, int64_t created_at) {
        records.push_back(row_to_record(std::move(id), std::move(text),
                                        std::move(source_reference), metadata_json,
                                        embedding_blob, std::move(embedding_model_id),
                                        created_at));
      };
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("get_many", e));
  }
  return records;
}

bool CollectionStore::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << "DELETE FROM records WHERE id = ?" << id;
    bool removed = sqlite3_changes(conn->connection().get()) > 0;
    if (removed) {
      bump_generation(*conn);
    }
    tx.commit();
    return removed;
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("remove", e));
  }
}

std::vector<std::string> CollectionStore::remove_where(const RecordFilter &filter) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::vector<std::string> removed;
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    // Selection and deletion share the transaction so no writer slips in between
    *conn << "SELECT id, source_reference, metadata_json, embedding_model_id FROM records" >>
        [&](std::string id, std::string source_reference, std::string metadata_json,
            std::string embedding_model_id) {
          Metadata metadata;
          try {
            metadata = deserialize_metadata(metadata_json);
          } catch (const std::exception &e) {
            throw StorageError("Corrupt metadata for record '" + id + "': " + e.what());
          }
          if (filter.matches(source_reference, metadata, embedding_model_id)) {
            removed.push_back(std::move(id));
          }
        };

    for (const auto &id : removed) {
      *conn << "DELETE FROM records WHERE id = ?" << id;
    }
    if (!removed.empty()) {
      bump_generation(*conn);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("remove_where", e));
  }
  return removed;
}

std::vector<std::string> CollectionStore::remove_all() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::vector<std::string> removed;
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << "SELECT id FROM records" >> [&](std::string id) { removed.push_back(std::move(id)); };
    *conn << "DELETE FROM records";
    if (!removed.empty()) {
      bump_generation(*conn);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("remove_all", e));
  }
  return removed;
}

size_t CollectionStore::size() {
  try {
    PooledConnection conn(*db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM records" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("size", e));
  }
}

std::vector<std::string> CollectionStore::matching_ids(const RecordFilter &filter) {
  std::vector<std::string> ids;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT id, source_reference, metadata_json, embedding_model_id FROM records" >>
        [&](std::string id, std::string source_reference, std::string metadata_json,
            std::string embedding_model_id) {
          Metadata metadata;
          try {
            metadata = deserialize_metadata(metadata_json);
          } catch (const std::exception &e) {
            throw StorageError("Corrupt metadata for record '" + id + "': " + e.what());
          }
          if (filter.matches(source_reference, metadata, embedding_model_id)) {
            ids.push_back(std::move(id));
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("matching_ids", e));
  }
  return ids;
}

int64_t CollectionStore::max_row_id() {
  try {
    PooledConnection conn(*db_manager_);
    int64_t max_row = 0;
    *conn << "SELECT COALESCE(MAX(row_id), 0) FROM records" >> max_row;
    return max_row;
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("max_row_id", e));
  }
}

RecordCursor CollectionStore::all(size_t page_size) {
  return RecordCursor(shared_from_this(), max_row_id(), page_size);
}

std::vector<std::pair<int64_t, Record>> CollectionStore::fetch_page(int64_t after_row_id,
                                                                    int64_t max_row_id,
                                                                    size_t limit) {
  std::vector<std::pair<int64_t, Record>> page;
  try {
    PooledConnection conn(*db_manager_);
    *conn << std::string("SELECT row_id, ") + RECORD_COLUMNS +
                 " FROM records WHERE row_id > ? AND row_id <= ? ORDER BY row_id LIMIT ?"
          << after_row_id << max_row_id << static_cast<int64_t>(limit) >>
        [&](int64_t row_id, std::string id, std::string text, std::string source_reference,
            std::string metadata_json, std::vector<char> embedding_blob,
            std::string embedding_model_id, int64_t created_at) {
          page.emplace_back(row_id, row_to_record(std::move(id), std::move(text),
                                                  std::move(source_reference), metadata_json,
                                                  embedding_blob, std::move(embedding_model_id),
                                                  created_at));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("fetch_page", e));
  }
  return page;
}

void CollectionStore::for_each_embedding(
    const std::function<void(int64_t, const std::string &, const std::vector<float> &)>
        &callback) {
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT row_id, id, embedding_blob FROM records ORDER BY row_id" >>
        [&](int64_t row_id, std::string id, std::vector<char> embedding_blob) {
          callback(row_id, id, blob_to_embedding(id, embedding_blob));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("for_each_embedding", e));
  }
}

std::vector<std::string> CollectionStore::list_sources() {
  std::vector<std::string> sources;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT DISTINCT source_reference FROM records WHERE source_reference != '' "
             "ORDER BY source_reference" >>
        [&](std::string source) { sources.push_back(std::move(source)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("list_sources", e));
  }
  return sources;
}

CollectionStats CollectionStore::stats() {
  CollectionStats stats;
  stats.collection_name = descriptor_.name;
  stats.dimension = descriptor_.dimension;
  try {
    PooledConnection conn(*db_manager_);
    int64_t total = 0;
    int64_t sources = 0;
    int64_t characters = 0;
    *conn << "SELECT COUNT(*), COUNT(DISTINCT NULLIF(source_reference, '')), "
             "COALESCE(SUM(LENGTH(text)), 0) FROM records" >>
        [&](int64_t t, int64_t s, int64_t c) {
          total = t;
          sources = s;
          characters = c;
        };
    *conn << "SELECT DISTINCT embedding_model_id FROM records WHERE embedding_model_id != '' "
             "ORDER BY embedding_model_id" >>
        [&](std::string model) { stats.embedding_models.push_back(std::move(model)); };

    stats.total_records = static_cast<size_t>(total);
    stats.unique_sources = static_cast<size_t>(sources);
    stats.total_characters = static_cast<size_t>(characters);
    stats.average_text_length =
        total > 0 ? static_cast<double>(characters) / static_cast<double>(total) : 0.0;
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("stats", e));
  }
  return stats;
}

int64_t CollectionStore::generation() {
  try {
    PooledConnection conn(*db_manager_);
    int64_t generation = 0;
    *conn << "SELECT generation FROM collection_info WHERE singleton = 1" >> generation;
    return generation;
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("generation", e));
  }
}

std::string CollectionStore::quick_check() {
  try {
    PooledConnection conn(*db_manager_);
    std::string result;
    *conn << "PRAGMA quick_check;" >> [&](std::string row) {
      if (result.empty()) {
        result = row;
      }
    };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("quick_check", e));
  }
}

void CollectionStore::checkpoint() {
  try {
    PooledConnection conn(*db_manager_);
    *conn << "PRAGMA wal_checkpoint(TRUNCATE);";
  } catch (const sqlite::sqlite_exception &e) {
    throw StorageError(format_db_error("checkpoint", e));
  }
}

}  // namespace vault_core
