#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <memory>
#include <unordered_set>

#include "vault_core/index/similarity_index.hpp"

namespace vault_core {

// Exact inner-product search over unit vectors stored contiguously in a faiss
// flat index labelled by storage row id. Results are widened to every
// candidate tied with the k-th score and re-ranked with the shared ordering
// rules, so rankings match FlatIndex.
//
// Replacements and removals are queued and applied in one pass by refresh().
// Until then, and whenever faiss fails, searches fall back to the exact scan.
class FaissIndex final : public SimilarityIndex {
 public:
  // Scores within this distance of the k-th score count as ties.
  static constexpr float TIE_TOLERANCE = 1e-6f;

  explicit FaissIndex(size_t dimension);
  ~FaissIndex() override;

  IndexType type() const override {
    return IndexType::Faiss;
  }

  std::vector<ScoredId> search(const std::vector<float> &query, size_t top_k,
                               const IdPredicate &accept = {}) const override;

  void refresh() override;

  bool is_synced() const {
    return vectors_ != nullptr && pending_rows_.empty();
  }
  size_t stored_vectors() const;
  size_t rebuild_count() const {
    return rebuilds_;
  }

 protected:
  void on_upsert(int64_t row_id, bool existed) override;
  void on_remove(int64_t row_id) override;
  void on_clear() override;

 private:
  std::unique_ptr<faiss::IndexIDMap> create_vectors() const;
  void rebuild();
  void apply_pending();

  std::unique_ptr<faiss::IndexIDMap> vectors_;
  // Rows whose stored vector was replaced or deleted since the last refresh.
  std::unordered_set<int64_t> pending_rows_;
  size_t rebuilds_ = 0;
};

}  // namespace vault_core
