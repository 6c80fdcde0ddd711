#include "vault_core/index/faiss_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <iostream>

namespace vault_core {

FaissIndex::FaissIndex(size_t dimension) : SimilarityIndex(dimension) {}

FaissIndex::~FaissIndex() = default;

std::unique_ptr<faiss::IndexIDMap> FaissIndex::create_vectors() const {
  auto flat = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension_));
  // Wrap with IDMap so labels are storage row ids
  auto index = std::make_unique<faiss::IndexIDMap>(flat.release());
  index->own_fields = true;
  return index;
}

size_t FaissIndex::stored_vectors() const {
  return vectors_ ? static_cast<size_t>(vectors_->ntotal) : 0;
}

void FaissIndex::rebuild() {
  auto index = create_vectors();

  std::vector<faiss::idx_t> labels;
  std::vector<float> all_vectors_flat;
  labels.reserve(entries_.size());
  all_vectors_flat.reserve(entries_.size() * dimension_);
  for (const auto &[id, entry] : entries_) {
    labels.push_back(entry.row_id);
    all_vectors_flat.insert(all_vectors_flat.end(), entry.unit.begin(), entry.unit.end());
  }

  pending_rows_.clear();
  ++rebuilds_;
  try {
    if (!labels.empty()) {
      index->add_with_ids(static_cast<faiss::idx_t>(labels.size()), all_vectors_flat.data(),
                          labels.data());
    }
  } catch (const faiss::FaissException &e) {
    std::cerr << "Warning: faiss index build failed, using exhaustive scan: " << e.what()
              << std::endl;
    vectors_.reset();
    return;
  }
  vectors_ = std::move(index);
}

void FaissIndex::apply_pending() {
  std::vector<faiss::idx_t> rows(pending_rows_.begin(), pending_rows_.end());
  pending_rows_.clear();

  // Replaced rows come back with their current vector
  std::vector<faiss::idx_t> labels;
  std::vector<float> replacements;
  for (faiss::idx_t row : rows) {
    auto live = ids_by_row_.find(row);
    if (live == ids_by_row_.end()) {
      continue;
    }
    const auto &unit = entries_.at(live->second).unit;
    labels.push_back(row);
    replacements.insert(replacements.end(), unit.begin(), unit.end());
  }

  try {
    faiss::IDSelectorBatch selector(rows.size(), rows.data());
    vectors_->remove_ids(selector);
    if (!labels.empty()) {
      vectors_->add_with_ids(static_cast<faiss::idx_t>(labels.size()), replacements.data(),
                             labels.data());
    }
  } catch (const faiss::FaissException &e) {
    std::cerr << "Warning: faiss index update failed, rebuilding: " << e.what() << std::endl;
    rebuild();
  }
}

void FaissIndex::refresh() {
  if (!vectors_) {
    rebuild();
  } else if (!pending_rows_.empty()) {
    apply_pending();
  }
}

void FaissIndex::on_upsert(int64_t row_id, bool existed) {
  if (!vectors_) {
    return;
  }
  if (existed) {
    pending_rows_.insert(row_id);
    return;
  }
  const auto &unit = entries_.at(ids_by_row_.at(row_id)).unit;
  faiss::idx_t label = row_id;
  try {
    vectors_->add_with_ids(1, unit.data(), &label);
  } catch (const faiss::FaissException &e) {
    std::cerr << "Warning: faiss insert failed for row " << row_id << ", scheduling rebuild: "
              << e.what() << std::endl;
    vectors_.reset();
  }
}

void FaissIndex::on_remove(int64_t row_id) {
  if (vectors_) {
    pending_rows_.insert(row_id);
  }
}

void FaissIndex::on_clear() {
  vectors_.reset();
  pending_rows_.clear();
}

std::vector<ScoredId> FaissIndex::search(const std::vector<float> &query, size_t top_k,
                                         const IdPredicate &accept) const {
  std::vector<float> unit_query = to_unit_vector(query);
  if (accept || !is_synced() || vectors_->ntotal == 0 || top_k == 0) {
    return exact_search(unit_query, top_k, accept);
  }

  const faiss::idx_t total = vectors_->ntotal;
  const faiss::idx_t wanted = std::min(static_cast<faiss::idx_t>(top_k), total);
  faiss::idx_t k = wanted;
  std::vector<float> scores;
  std::vector<faiss::idx_t> labels;
  while (true) {
    scores.assign(k, 0.0f);
    labels.assign(k, -1);
    try {
      vectors_->search(1, unit_query.data(), k, scores.data(), labels.data());
    } catch (const faiss::FaissException &e) {
      std::cerr << "Warning: faiss search failed, using exhaustive scan: " << e.what()
                << std::endl;
      return exact_search(unit_query, top_k, accept);
    }

    float boundary = scores[wanted - 1];
    // Clamped scores all tie at zero; only the full scan orders them by id
    if (boundary <= TIE_TOLERANCE) {
      return exact_search(unit_query, top_k, accept);
    }
    if (k == total || scores[k - 1] < boundary - TIE_TOLERANCE) {
      break;
    }
    k = std::min(k * 2, total);
  }

  std::vector<ScoredId> candidates;
  candidates.reserve(labels.size());
  for (faiss::idx_t label : labels) {
    if (label == -1) {
      continue;
    }
    auto row = ids_by_row_.find(label);
    if (row == ids_by_row_.end()) {
      continue;
    }
    const auto &entry = entries_.at(row->second);
    candidates.push_back(
        {row->second, clamped_cosine(unit_query.data(), entry.unit.data(), dimension_)});
  }
  select_top_k(candidates, top_k);
  return candidates;
}

}  // namespace vault_core
