#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "vault_core/collection_options.hpp"

namespace vault_core {

struct ScoredId {
  std::string id;
  float score = 0.0f;
};

// Best first: higher score, then ascending id.
bool ranks_before(const ScoredId &a, const ScoredId &b);

// Cosine similarity of two unit vectors clamped to [0, 1].
float clamped_cosine(const float *unit_a, const float *unit_b, size_t dimension);

// Scales to unit length. A zero vector stays zero.
std::vector<float> to_unit_vector(const std::vector<float> &vector);

// Keeps the top_k best candidates, ordered best first.
void select_top_k(std::vector<ScoredId> &candidates, size_t top_k);

using IdPredicate = std::function<bool(const std::string &)>;

// In-memory copy of the collection's vectors, kept as unit vectors keyed by
// record id. Subclasses decide how candidates are found; scoring and ordering
// are shared so every index ranks identically.
class SimilarityIndex {
 public:
  explicit SimilarityIndex(size_t dimension);
  virtual ~SimilarityIndex() = default;

  SimilarityIndex(const SimilarityIndex &) = delete;
  SimilarityIndex &operator=(const SimilarityIndex &) = delete;

  // row_id is the record's stable storage row, used as the external label.
  void upsert(int64_t row_id, const std::string &id, const std::vector<float> &embedding);
  bool remove(const std::string &id);
  void clear();

  size_t size() const {
    return entries_.size();
  }
  size_t dimension() const {
    return dimension_;
  }

  virtual IndexType type() const = 0;

  // Query is expected to be validated. accept, when set, restricts the
  // candidates to ids it returns true for.
  virtual std::vector<ScoredId> search(const std::vector<float> &query, size_t top_k,
                                       const IdPredicate &accept = {}) const = 0;

  // Applies pending structural work after a batch of mutations.
  virtual void refresh() {}

 protected:
  struct Entry {
    int64_t row_id;
    std::vector<float> unit;
  };

  std::vector<ScoredId> exact_search(const std::vector<float> &unit_query, size_t top_k,
                                     const IdPredicate &accept) const;

  virtual void on_upsert(int64_t row_id, bool existed) {}
  virtual void on_remove(int64_t row_id) {}
  virtual void on_clear() {}

  size_t dimension_;
  std::unordered_map<std::string, Entry> entries_;
  std::unordered_map<int64_t, std::string> ids_by_row_;
};

// Exhaustive scan. Exact.
class FlatIndex final : public SimilarityIndex {
 public:
  explicit FlatIndex(size_t dimension);

  IndexType type() const override {
    return IndexType::Flat;
  }

  std::vector<ScoredId> search(const std::vector<float> &query, size_t top_k,
                               const IdPredicate &accept = {}) const override;
};

std::unique_ptr<SimilarityIndex> make_similarity_index(const CollectionOptions &options);

}  // namespace vault_core
