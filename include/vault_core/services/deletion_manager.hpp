#pragma once

#include <memory>
#include <string>

#include "vault_core/db/collection_store.hpp"
#include "vault_core/index/similarity_index.hpp"
#include "vault_core/record_filter.hpp"

namespace vault_core {

class DeletionManager {
 public:
  DeletionManager(std::shared_ptr<CollectionStore> store, std::shared_ptr<SimilarityIndex> index);

  // False when no record had this id.
  bool remove(const std::string &id);

  // Returns the exact number removed; zero when nothing matches. An empty
  // filter is rejected, use clear() to drop everything.
  size_t remove_where(const RecordFilter &filter);

  size_t remove_by_source(const std::string &source_reference);

  size_t clear();

 private:
  std::shared_ptr<CollectionStore> store_;
  std::shared_ptr<SimilarityIndex> index_;
};

}  // namespace vault_core
