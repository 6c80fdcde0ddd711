#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "vault_core/collection_options.hpp"
#include "vault_core/db/collection_store.hpp"
#include "vault_core/db/database_manager.hpp"
#include "vault_core/index/similarity_index.hpp"
#include "vault_core/query_embedder.hpp"
#include "vault_core/record_filter.hpp"
#include "vault_core/record_validator.hpp"
#include "vault_core/services/batch_coordinator.hpp"
#include "vault_core/services/deletion_manager.hpp"
#include "vault_core/types/record.hpp"

namespace vault_core {

/*
Public entry point for one collection rooted at options.storage_path.

The engine starts Closed. open() creates or reconnects to the collection and
loads the similarity index; every other operation requires Open and throws
NotOpenError otherwise. close() is idempotent.

Thread-safe: queries share a lock, mutations and open/close take it
exclusively. Multi-process access to one storage root is not coordinated.
*/
class VectorEngine {
 public:
  static constexpr const char *DATABASE_FILE = "collection.db";

  explicit VectorEngine(CollectionOptions options,
                        std::shared_ptr<QueryEmbedder> query_embedder = nullptr);
  ~VectorEngine();

  VectorEngine(const VectorEngine &) = delete;
  VectorEngine &operator=(const VectorEngine &) = delete;

  void open();
  void close();
  bool is_open() const;

  const CollectionOptions &options() const {
    return options_;
  }

  void set_query_embedder(std::shared_ptr<QueryEmbedder> query_embedder);

  PutResult add(const Record &record);
  BatchResult add_batch(const std::vector<Record> &records);

  std::vector<SearchResult> search_by_vector(
      const std::vector<float> &query_vector, int top_k,
      const std::optional<RecordFilter> &filter = std::nullopt) const;
  std::vector<SearchResult> search_by_text(
      const std::string &query_text, int top_k,
      const std::optional<RecordFilter> &filter = std::nullopt) const;

  std::optional<Record> get(const std::string &id) const;
  bool remove(const std::string &id);
  size_t remove_where(const RecordFilter &filter);
  size_t remove_by_source(const std::string &source_reference);
  size_t clear();

  size_t size() const;
  RecordCursor all(size_t page_size = 256) const;
  std::vector<std::string> list_sources() const;
  CollectionStats stats() const;

  // Never throws. A closed engine or a failing storage check reports
  // unhealthy with the reason in error.
  HealthReport health_check() const;

 private:
  void require_open(const char *operation) const;
  std::vector<SearchResult> search_locked(const std::vector<float> &query_vector, int top_k,
                                          const std::optional<RecordFilter> &filter) const;
  std::filesystem::path database_path() const;

  CollectionOptions options_;
  std::shared_ptr<QueryEmbedder> query_embedder_;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<DatabaseManager> db_manager_;
  std::shared_ptr<CollectionStore> store_;
  std::shared_ptr<SimilarityIndex> index_;
  std::unique_ptr<RecordValidator> validator_;
  std::unique_ptr<BatchCoordinator> batch_coordinator_;
  std::unique_ptr<DeletionManager> deletion_manager_;
};

}  // namespace vault_core
