#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace vault_core {

enum class DuplicatePolicy { Upsert, Reject };

inline std::string to_string(DuplicatePolicy policy) {
  switch (policy) {
    case DuplicatePolicy::Upsert:
      return "upsert";
    case DuplicatePolicy::Reject:
      return "reject";
    default:
      return "unknown";
  }
}

inline DuplicatePolicy duplicate_policy_from_string(const std::string &str) {
  if (str == "upsert")
    return DuplicatePolicy::Upsert;
  if (str == "reject")
    return DuplicatePolicy::Reject;
  throw std::invalid_argument("Unknown DuplicatePolicy: " + str);
}

enum class IndexType { Flat, Faiss };

inline std::string to_string(IndexType type) {
  switch (type) {
    case IndexType::Flat:
      return "flat";
    case IndexType::Faiss:
      return "faiss";
    default:
      return "unknown";
  }
}

inline IndexType index_type_from_string(const std::string &str) {
  if (str == "flat")
    return IndexType::Flat;
  if (str == "faiss")
    return IndexType::Faiss;
  throw std::invalid_argument("Unknown IndexType: " + str);
}

struct CollectionOptions {
  std::filesystem::path storage_path;
  std::string collection_name = "research_chunks";
  size_t dimension = 384;
  // Only honoured when the collection is created; the stored flag wins on reopen.
  bool reject_empty_text = false;
  DuplicatePolicy duplicate_policy = DuplicatePolicy::Upsert;
  IndexType index_type = IndexType::Flat;
  int pool_size = 4;
  size_t batch_chunk_size = 500;
};

}  // namespace vault_core
