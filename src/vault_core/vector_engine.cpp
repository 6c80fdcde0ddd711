#include "vault_core/vector_engine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace vault_core {

VectorEngine::VectorEngine(CollectionOptions options,
                           std::shared_ptr<QueryEmbedder> query_embedder)
    : options_(std::move(options)), query_embedder_(std::move(query_embedder)) {}

VectorEngine::~VectorEngine() {
  try {
    close();
  } catch (const std::exception &e) {
    std::cerr << "Warning: failed to close collection at " << options_.storage_path << ": "
              << e.what() << std::endl;
  }
}

std::filesystem::path VectorEngine::database_path() const {
  return options_.storage_path / DATABASE_FILE;
}

void VectorEngine::open() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (store_) {
    return;
  }
  if (options_.storage_path.empty()) {
    throw InvalidArgumentError("storage_path cannot be empty");
  }
  if (options_.dimension == 0) {
    throw InvalidArgumentError("dimension must be greater than 0");
  }
  if (options_.pool_size <= 0) {
    throw InvalidArgumentError("pool_size must be greater than 0");
  }

  try {
    std::filesystem::create_directories(options_.storage_path);
  } catch (const std::filesystem::filesystem_error &e) {
    throw StorageError("Cannot create storage root " + options_.storage_path.string() + ": " +
                       e.what());
  }
  if (!std::filesystem::is_directory(options_.storage_path)) {
    throw StorageError("Storage root " + options_.storage_path.string() + " is not a directory");
  }

  // Locals until everything succeeded, so a failed open leaves the engine Closed
  auto db_manager = std::make_shared<DatabaseManager>();
  db_manager->initialize(database_path(), options_.pool_size);
  auto store = std::make_shared<CollectionStore>(db_manager, options_);

  const CollectionDescriptor &descriptor = store->descriptor();
  RecordValidator validator(descriptor.dimension, descriptor.reject_empty_text);

  std::shared_ptr<SimilarityIndex> index = make_similarity_index(options_);
  store->for_each_embedding(
      [&](int64_t row_id, const std::string &id, const std::vector<float> &embedding) {
        index->upsert(row_id, id, embedding);
      });
  index->refresh();

  validator_ = std::make_unique<RecordValidator>(validator);
  batch_coordinator_ = std::make_unique<BatchCoordinator>(
      store, index, validator, options_.duplicate_policy, options_.batch_chunk_size);
  deletion_manager_ = std::make_unique<DeletionManager>(store, index);
  index_ = std::move(index);
  store_ = std::move(store);
  db_manager_ = std::move(db_manager);
}

void VectorEngine::close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!store_) {
    return;
  }

  // Records are already committed; the checkpoint is best effort
  try {
    store_->checkpoint();
  } catch (const VaultError &e) {
    std::cerr << "Warning: WAL checkpoint failed: " << e.what() << std::endl;
  }

  deletion_manager_.reset();
  batch_coordinator_.reset();
  validator_.reset();
  index_.reset();
  store_.reset();
  db_manager_->shutdown();
  db_manager_.reset();
}

bool VectorEngine::is_open() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return store_ != nullptr;
}

void VectorEngine::set_query_embedder(std::shared_ptr<QueryEmbedder> query_embedder) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  query_embedder_ = std::move(query_embedder);
}

void VectorEngine::require_open(const char *operation) const {
  if (!store_) {
    throw NotOpenError(operation);
  }
}

PutResult VectorEngine::add(const Record &record) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  require_open("add");
  return batch_coordinator_->add(record);
}

BatchResult VectorEngine::add_batch(const std::vector<Record> &records) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  require_open("add_batch");
  return batch_coordinator_->add_batch(records);
}

std::vector<SearchResult> VectorEngine::search_by_vector(
    const std::vector<float> &query_vector, int top_k,
    const std::optional<RecordFilter> &filter) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  require_open("search_by_vector");
  if (top_k <= 0) {
    throw InvalidArgumentError("top_k must be positive, got " + std::to_string(top_k));
  }
  validator_->validate_query(query_vector);
  return search_locked(query_vector, top_k, filter);
}

std::vector<SearchResult> VectorEngine::search_by_text(
    const std::string &query_text, int top_k, const std::optional<RecordFilter> &filter) const {
  std::shared_ptr<QueryEmbedder> embedder;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    require_open("search_by_text");
    embedder = query_embedder_;
  }
  if (top_k <= 0) {
    throw InvalidArgumentError("top_k must be positive, got " + std::to_string(top_k));
  }
  bool blank = std::all_of(query_text.begin(), query_text.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
  if (blank) {
    throw InvalidArgumentError("Query text cannot be empty");
  }
  if (!embedder) {
    throw InvalidArgumentError("search_by_text requires a query embedder");
  }

  // No lock held here; the embedder may call back into the engine
  std::vector<float> query_vector = embedder->get_embedding(query_text);

  std::shared_lock<std::shared_mutex> lock(mutex_);
  require_open("search_by_text");
  validator_->validate_query(query_vector);
  return search_locked(query_vector, top_k, filter);
}

std::vector<SearchResult> VectorEngine::search_locked(
    const std::vector<float> &query_vector, int top_k,
    const std::optional<RecordFilter> &filter) const {
  std::vector<ScoredId> hits;
  if (filter && !filter->empty()) {
    auto allowed_ids = store_->matching_ids(*filter);
    if (allowed_ids.empty()) {
      return {};
    }
    std::unordered_set<std::string> allowed(allowed_ids.begin(), allowed_ids.end());
    hits = index_->search(query_vector, static_cast<size_t>(top_k),
                          [&allowed](const std::string &id) { return allowed.count(id) > 0; });
  } else {
    hits = index_->search(query_vector, static_cast<size_t>(top_k));
  }
  if (hits.empty()) {
    return {};
  }

  // Fetch all hit records in one query, then assemble in ranked order
  std::vector<std::string> ids;
  ids.reserve(hits.size());
  for (const auto &hit : hits) {
    ids.push_back(hit.id);
  }
  std::unordered_map<std::string, Record> records_by_id;
  for (auto &record : store_->get_many(ids)) {
    std::string id = record.id;
    records_by_id.emplace(std::move(id), std::move(record));
  }

  std::vector<SearchResult> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    auto it = records_by_id.find(hit.id);
    if (it == records_by_id.end()) {
      std::cerr << "Warning: index returned id '" << hit.id
                << "' but no corresponding record found in storage." << std::endl;
      continue;
    }
    SearchResult result;
    result.id = hit.id;
    result.text = std::move(it->second.text);
    result.source_reference = std::move(it->second.source_reference);
    result.metadata = std::move(it->second.metadata);
    result.score = hit.score;
    result.rank = static_cast<int>(results.size()) + 1;
    results.push_back(std::move(result));
  }
  return results;
}

std::optional<Record> VectorEngine::get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  require_open("get");
  return store_->get(id);
}

bool VectorEngine::remove(const std::string &id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  require_open("remove");
  return deletion_manager_->remove(id);
}

size_t VectorEngine::remove_where(const RecordFilter &filter) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  require_open("remove_where");
  return deletion_manager_->remove_where(filter);
}

size_t VectorEngine::remove_by_source(const std::string &source_reference) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  require_open("remove_by_source");
  return deletion_manager_->remove_by_source(source_reference);
}

size_t VectorEngine::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  require_open("clear");
  return deletion_manager_->clear();
}

size_t VectorEngine::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  require_open("size");
  return store_->size();
}

RecordCursor VectorEngine::all(size_t page_size) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  require_open("all");
  return store_->all(page_size);
}

std::vector<std::string> VectorEngine::list_sources() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  require_open("list_sources");
  return store_->list_sources();
}

CollectionStats VectorEngine::stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  require_open("stats");
  CollectionStats stats = store_->stats();
  stats.index_type = to_string(index_->type());
  return stats;
}

HealthReport VectorEngine::health_check() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  HealthReport report;
  report.checked_at = std::chrono::system_clock::now();
  report.storage_path = options_.storage_path.string();
  report.collection_name = options_.collection_name;
  report.dimension = options_.dimension;
  report.query_embedder_configured = query_embedder_ != nullptr;
  if (!store_) {
    report.error = "Collection is not open";
    return report;
  }

  report.collection_name = store_->descriptor().name;
  report.dimension = store_->descriptor().dimension;
  try {
    report.collection_size = store_->size();
    report.generation = store_->generation();
    std::string integrity = store_->quick_check();
    if (integrity != "ok") {
      report.error = "Integrity check failed: " + integrity;
      return report;
    }
  } catch (const VaultError &e) {
    std::cerr << "Warning: health check failed: " << e.what() << std::endl;
    report.error = e.what();
    return report;
  }
  report.healthy = true;
  return report;
}

}  // namespace vault_core
