#include "vault_core/services/deletion_manager.hpp"

#include <variant>

#include "vault_core/errors.hpp"

namespace vault_core {

DeletionManager::DeletionManager(std::shared_ptr<CollectionStore> store,
                                 std::shared_ptr<SimilarityIndex> index)
    : store_(std::move(store)), index_(std::move(index)) {}

bool DeletionManager::remove(const std::string &id) {
  if (!store_->remove(id)) {
    return false;
  }
  index_->remove(id);
  index_->refresh();
  return true;
}

size_t DeletionManager::remove_where(const RecordFilter &filter) {
  if (filter.empty()) {
    throw InvalidArgumentError("remove_where requires at least one filter clause");
  }
  for (const auto &clause : filter.clauses()) {
    if (const auto *contains = std::get_if<SourceContains>(&clause)) {
      if (contains->fragment.empty()) {
        throw InvalidArgumentError("Source fragment cannot be empty");
      }
    }
  }

  auto removed = store_->remove_where(filter);
  for (const auto &id : removed) {
    index_->remove(id);
  }
  if (!removed.empty()) {
    index_->refresh();
  }
  return removed.size();
}

size_t DeletionManager::remove_by_source(const std::string &source_reference) {
  if (source_reference.empty()) {
    throw InvalidArgumentError("Source reference cannot be empty");
  }
  return remove_where(RecordFilter::source_equals(source_reference));
}

size_t DeletionManager::clear() {
  auto removed = store_->remove_all();
  index_->clear();
  index_->refresh();
  return removed.size();
}

}  // namespace vault_core
