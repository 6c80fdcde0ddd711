#include "vault_core/index/similarity_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>

#include "vault_core/index/faiss_index.hpp"

namespace vault_core {

bool ranks_before(const ScoredId &a, const ScoredId &b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  return a.id < b.id;
}

float clamped_cosine(const float *unit_a, const float *unit_b, size_t dimension) {
  float cosine = faiss::fvec_inner_product(unit_a, unit_b, dimension);
  return std::clamp(cosine, 0.0f, 1.0f);
}

std::vector<float> to_unit_vector(const std::vector<float> &vector) {
  std::vector<float> unit(vector);
  if (unit.empty()) {
    return unit;
  }
  float norm = std::sqrt(faiss::fvec_norm_L2sqr(unit.data(), unit.size()));
  if (norm > 0.0f) {
    for (auto &value : unit) {
      value /= norm;
    }
  }
  return unit;
}

void select_top_k(std::vector<ScoredId> &candidates, size_t top_k) {
  if (candidates.size() > top_k) {
    std::partial_sort(candidates.begin(), candidates.begin() + top_k, candidates.end(),
                      ranks_before);
    candidates.resize(top_k);
  } else {
    std::sort(candidates.begin(), candidates.end(), ranks_before);
  }
}

SimilarityIndex::SimilarityIndex(size_t dimension) : dimension_(dimension) {}

void SimilarityIndex::upsert(int64_t row_id, const std::string &id,
                             const std::vector<float> &embedding) {
  auto it = entries_.find(id);
  bool existed = it != entries_.end();
  if (existed && it->second.row_id != row_id) {
    int64_t old_row = it->second.row_id;
    ids_by_row_.erase(old_row);
    on_remove(old_row);
    existed = false;
  }
  entries_[id] = Entry{row_id, to_unit_vector(embedding)};
  ids_by_row_[row_id] = id;
  on_upsert(row_id, existed);
}

bool SimilarityIndex::remove(const std::string &id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return false;
  }
  int64_t row_id = it->second.row_id;
  ids_by_row_.erase(row_id);
  entries_.erase(it);
  on_remove(row_id);
  return true;
}

void SimilarityIndex::clear() {
  entries_.clear();
  ids_by_row_.clear();
  on_clear();
}

std::vector<ScoredId> SimilarityIndex::exact_search(const std::vector<float> &unit_query,
                                                    size_t top_k,
                                                    const IdPredicate &accept) const {
  std::vector<ScoredId> candidates;
  candidates.reserve(accept ? std::min<size_t>(entries_.size(), 1024) : entries_.size());
  for (const auto &[id, entry] : entries_) {
    if (accept && !accept(id)) {
      continue;
    }
    candidates.push_back({id, clamped_cosine(unit_query.data(), entry.unit.data(), dimension_)});
  }
  select_top_k(candidates, top_k);
  return candidates;
}

FlatIndex::FlatIndex(size_t dimension) : SimilarityIndex(dimension) {}

std::vector<ScoredId> FlatIndex::search(const std::vector<float> &query, size_t top_k,
                                        const IdPredicate &accept) const {
  return exact_search(to_unit_vector(query), top_k, accept);
}

std::unique_ptr<SimilarityIndex> make_similarity_index(const CollectionOptions &options) {
  switch (options.index_type) {
    case IndexType::Faiss:
      return std::make_unique<FaissIndex>(options.dimension);
    case IndexType::Flat:
    default:
      return std::make_unique<FlatIndex>(options.dimension);
  }
}

}  // namespace vault_core
