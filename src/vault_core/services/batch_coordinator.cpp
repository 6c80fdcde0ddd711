#include "vault_core/services/batch_coordinator.hpp"

#include <algorithm>
#include <iostream>

namespace vault_core {

BatchCoordinator::BatchCoordinator(std::shared_ptr<CollectionStore> store,
                                   std::shared_ptr<SimilarityIndex> index,
                                   RecordValidator validator, DuplicatePolicy policy,
                                   size_t chunk_size)
    : store_(std::move(store)),
      index_(std::move(index)),
      validator_(std::move(validator)),
      policy_(policy),
      chunk_size_(std::max<size_t>(chunk_size, 1)) {}

PutResult BatchCoordinator::add(const Record &record) {
  validator_.validate(record);
  WriteOutcome outcome = store_->put(record, policy_);
  index_->upsert(outcome.row_id, record.id, record.embedding);
  index_->refresh();
  return PutResult{outcome.replaced, outcome.created_at};
}

BatchResult BatchCoordinator::add_batch(const std::vector<Record> &records) {
  BatchResult result;
  std::vector<const Record *> chunk;
  chunk.reserve(std::min(chunk_size_, records.size()));

  for (const auto &record : records) {
    try {
      validator_.validate(record);
    } catch (const ValidationError &e) {
      result.rejected.push_back({record.id, e.kind(), e.what()});
      continue;
    }
    chunk.push_back(&record);
    if (chunk.size() == chunk_size_) {
      write_chunk(chunk, result);
      chunk.clear();
    }
  }
  if (!chunk.empty()) {
    write_chunk(chunk, result);
  }

  index_->refresh();
  return result;
}

void BatchCoordinator::write_chunk(const std::vector<const Record *> &chunk, BatchResult &result) {
  std::vector<RejectedRecord> duplicates;
  std::vector<std::pair<size_t, WriteOutcome>> written;
  try {
    written = store_->put_many(chunk, policy_,
                               [&](const Record &record, const DuplicateIdentifierError &e) {
                                 duplicates.push_back({record.id, e.kind(), e.what()});
                               });
  } catch (const StorageError &e) {
    // The chunk rolled back as a whole; earlier chunks stay committed
    std::cerr << "Warning: batch chunk of " << chunk.size()
              << " records was not written: " << e.what() << std::endl;
    for (const Record *record : chunk) {
      result.rejected.push_back({record->id, e.kind(), e.what()});
    }
    return;
  }
  result.rejected.insert(result.rejected.end(), duplicates.begin(), duplicates.end());

  // Only committed rows reach the index
  for (const auto &[position, outcome] : written) {
    const Record &record = *chunk[position];
    index_->upsert(outcome.row_id, record.id, record.embedding);
    ++result.inserted;
    if (outcome.replaced) {
      ++result.replaced;
    }
  }
}

}  // namespace vault_core
