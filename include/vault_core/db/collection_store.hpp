#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "vault_core/collection_options.hpp"
#include "vault_core/db/database_manager.hpp"
#include "vault_core/errors.hpp"
#include "vault_core/record_filter.hpp"
#include "vault_core/types/record.hpp"

namespace vault_core {

// Written once when the collection is created.
struct CollectionDescriptor {
  std::string name;
  size_t dimension = 0;
  bool reject_empty_text = false;
  int format_version = 0;
  std::chrono::system_clock::time_point created_at;
};

struct WriteOutcome {
  int64_t row_id = 0;
  bool replaced = false;
  std::chrono::system_clock::time_point created_at;
};

class CollectionStore;

// Pages through the records that existed when it was created, in row order.
// Records removed meanwhile are skipped; replaced ones show their new content.
class RecordCursor {
 public:
  RecordCursor(std::shared_ptr<CollectionStore> store, int64_t max_row_id, size_t page_size);

  std::optional<Record> next();

 private:
  std::shared_ptr<CollectionStore> store_;
  int64_t last_row_id_ = 0;
  int64_t max_row_id_;
  size_t page_size_;
  bool exhausted_ = false;
  std::deque<std::pair<int64_t, Record>> buffer_;
};

// Durable id -> Record map backed by SQLite. Every mutating call commits its
// transaction before returning.
class CollectionStore : public std::enable_shared_from_this<CollectionStore> {
 public:
  static constexpr int FORMAT_VERSION = 1;

  // Reads the descriptor, creating it for a new collection. Throws
  // DimensionMismatchError when the stored dimension differs from
  // options.dimension and StorageError for a damaged collection.
  CollectionStore(std::shared_ptr<DatabaseManager> db_manager, const CollectionOptions &options);

  CollectionStore(const CollectionStore &) = delete;
  CollectionStore &operator=(const CollectionStore &) = delete;

  const CollectionDescriptor &descriptor() const {
    return descriptor_;
  }

  // Inserts or replaces by id. Throws DuplicateIdentifierError under
  // DuplicatePolicy::Reject when the id exists.
  WriteOutcome put(const Record &record, DuplicatePolicy policy);

  // Writes all records in one transaction. Duplicates rejected by the policy
  // are passed to on_rejected and skipped. Returns (input index, outcome) for
  // each written record.
  std::vector<std::pair<size_t, WriteOutcome>> put_many(
      const std::vector<const Record *> &records, DuplicatePolicy policy,
      const std::function<void(const Record &, const DuplicateIdentifierError &)> &on_rejected);

  std::optional<Record> get(const std::string &id);
  // Records in no particular order; missing ids are absent from the result.
  std::vector<Record> get_many(const std::vector<std::string> &ids);

  bool remove(const std::string &id);
  // Returns the ids removed.
  std::vector<std::string> remove_where(const RecordFilter &filter);
  std::vector<std::string> remove_all();

  size_t size();
  std::vector<std::string> matching_ids(const RecordFilter &filter);

  RecordCursor all(size_t page_size = 256);
  std::vector<std::pair<int64_t, Record>> fetch_page(int64_t after_row_id, int64_t max_row_id,
                                                     size_t limit);

  // Streams every stored embedding; used to build the in-memory index.
  void for_each_embedding(
      const std::function<void(int64_t, const std::string &, const std::vector<float> &)> &callback);

  std::vector<std::string> list_sources();
  // index_type is left for the caller to fill.
  CollectionStats stats();

  // Bumped by every committed mutation.
  int64_t generation();

  // First row of PRAGMA quick_check; "ok" for a healthy file.
  std::string quick_check();

  // Moves WAL content into the main database file.
  void checkpoint();

 private:
  void load_or_create_descriptor(const CollectionOptions &options);
  WriteOutcome write_record(sqlite::database &db, const Record &record, DuplicatePolicy policy);
  void bump_generation(sqlite::database &db);
  int64_t next_created_at_us();
  int64_t max_row_id();

  std::vector<float> blob_to_embedding(const std::string &id, const std::vector<char> &blob) const;
  static std::vector<char> embedding_to_blob(const std::vector<float> &embedding);
  Record row_to_record(std::string id, std::string text, std::string source_reference,
                       const std::string &metadata_json, const std::vector<char> &embedding_blob,
                       std::string embedding_model_id, int64_t created_at_us) const;

  std::shared_ptr<DatabaseManager> db_manager_;
  CollectionDescriptor descriptor_;
  std::mutex write_mutex_;
  int64_t last_created_at_us_ = 0;
};

}  // namespace vault_core
