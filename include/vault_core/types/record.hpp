#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace vault_core {

// Scalar metadata value. Nested structures are not stored.
using MetadataValue = std::variant<std::string, int64_t, double, bool>;

// Ordered by key so serialization is stable.
using Metadata = std::map<std::string, MetadataValue>;

struct Record {
  std::string id;
  std::string text;
  std::string source_reference;
  Metadata metadata;
  std::vector<float> embedding;
  std::string embedding_model_id;
  // Assigned by the store on insertion; ignored on input.
  std::chrono::system_clock::time_point created_at{};

  bool operator==(const Record &other) const {
    return id == other.id && text == other.text && source_reference == other.source_reference &&
           metadata == other.metadata && embedding == other.embedding &&
           embedding_model_id == other.embedding_model_id && created_at == other.created_at;
  }
  bool operator!=(const Record &other) const {
    return !(*this == other);
  }
};

struct SearchResult {
  std::string id;
  std::string text;
  std::string source_reference;
  Metadata metadata;
  float score = 0.0f;
  int rank = 0;
};

struct PutResult {
  bool replaced = false;
  std::chrono::system_clock::time_point created_at;
};

inline int64_t to_unix_micros(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point from_unix_micros(int64_t micros) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::microseconds(micros)));
}

struct CollectionStats {
  std::string collection_name;
  size_t dimension = 0;
  size_t total_records = 0;
  size_t unique_sources = 0;
  std::vector<std::string> embedding_models;
  size_t total_characters = 0;
  double average_text_length = 0.0;
  std::string index_type;
};

// Result of VectorEngine::health_check. error is set when healthy is false.
struct HealthReport {
  bool healthy = false;
  std::string error;
  size_t collection_size = 0;
  int64_t generation = 0;
  bool query_embedder_configured = false;
  std::string storage_path;
  std::string collection_name;
  size_t dimension = 0;
  std::chrono::system_clock::time_point checked_at;
};

}  // namespace vault_core
