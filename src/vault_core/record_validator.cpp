#include "vault_core/record_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <variant>

namespace vault_core {

RecordValidator::RecordValidator(size_t dimension, bool reject_empty_text)
    : dimension_(dimension), reject_empty_text_(reject_empty_text) {}

void RecordValidator::validate(const Record &record) const {
  validate_identifier(record.id);
  validate_embedding(record.embedding, "record '" + record.id + "'");
  if (reject_empty_text_ && record.text.empty()) {
    throw EmptyTextError("Record '" + record.id + "' has empty text");
  }
  validate_metadata(record);
}

void RecordValidator::validate_query(const std::vector<float> &query_vector) const {
  validate_embedding(query_vector, "query vector");
}

void RecordValidator::validate_identifier(const std::string &id) const {
  if (id.empty()) {
    throw InvalidIdentifierError("Record id cannot be empty");
  }
  if (id.find('\0') != std::string::npos) {
    throw InvalidIdentifierError("Record id cannot contain NUL bytes");
  }
  bool all_space = std::all_of(id.begin(), id.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  if (all_space) {
    throw InvalidIdentifierError("Record id cannot be whitespace only");
  }
}

void RecordValidator::validate_embedding(const std::vector<float> &embedding,
                                         const std::string &subject) const {
  if (embedding.size() != dimension_) {
    throw DimensionMismatchError(dimension_, embedding.size());
  }
  bool has_magnitude = false;
  for (size_t i = 0; i < embedding.size(); ++i) {
    if (!std::isfinite(embedding[i])) {
      throw InvalidEmbeddingValueError("Non-finite value at position " + std::to_string(i) +
                                       " in " + subject);
    }
    has_magnitude = has_magnitude || embedding[i] != 0.0f;
  }
  // Cosine similarity is undefined for a zero vector
  if (!has_magnitude) {
    throw InvalidEmbeddingValueError("Zero vector in " + subject);
  }
}

void RecordValidator::validate_metadata(const Record &record) const {
  for (const auto &[key, value] : record.metadata) {
    const auto *number = std::get_if<double>(&value);
    if (number && !std::isfinite(*number)) {
      throw InvalidMetadataValueError("Metadata '" + key + "' of record '" + record.id +
                                      "' is not a finite number");
    }
  }
}

}  // namespace vault_core
