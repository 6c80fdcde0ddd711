#pragma once

#include <memory>
#include <string>
#include <vector>

#include "vault_core/db/collection_store.hpp"
#include "vault_core/errors.hpp"
#include "vault_core/index/similarity_index.hpp"
#include "vault_core/record_validator.hpp"

namespace vault_core {

struct RejectedRecord {
  std::string id;
  ErrorKind kind;
  std::string message;
};

struct BatchResult {
  // Records written, including replacements.
  size_t inserted = 0;
  size_t replaced = 0;
  std::vector<RejectedRecord> rejected;
};

// Validates and writes records, keeping the in-memory index in step with the
// committed state.
class BatchCoordinator {
 public:
  BatchCoordinator(std::shared_ptr<CollectionStore> store, std::shared_ptr<SimilarityIndex> index,
                   RecordValidator validator, DuplicatePolicy policy, size_t chunk_size);

  // Single record: validation errors are thrown.
  PutResult add(const Record &record);

  // Invalid records are reported in the result and skipped; valid ones are
  // written one transaction per chunk. A chunk that fails in storage is
  // reported record by record with ErrorKind::Storage and the remaining
  // chunks are still attempted.
  BatchResult add_batch(const std::vector<Record> &records);

 private:
  void write_chunk(const std::vector<const Record *> &chunk, BatchResult &result);

  std::shared_ptr<CollectionStore> store_;
  std::shared_ptr<SimilarityIndex> index_;
  RecordValidator validator_;
  DuplicatePolicy policy_;
  size_t chunk_size_;
};

}  // namespace vault_core
