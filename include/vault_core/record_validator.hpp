#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "vault_core/errors.hpp"
#include "vault_core/types/record.hpp"

namespace vault_core {

// Structural checks run before a record reaches storage. Stateless apart from
// the collection-wide settings it is constructed with.
class RecordValidator {
 public:
  RecordValidator(size_t dimension, bool reject_empty_text);

  // Throws the ValidationError subclass naming the first rule violated.
  void validate(const Record &record) const;

  // Query vectors follow the same dimension and finiteness rules.
  void validate_query(const std::vector<float> &query_vector) const;

  size_t dimension() const {
    return dimension_;
  }
  bool reject_empty_text() const {
    return reject_empty_text_;
  }

 private:
  void validate_identifier(const std::string &id) const;
  void validate_embedding(const std::vector<float> &embedding, const std::string &subject) const;
  void validate_metadata(const Record &record) const;

  size_t dimension_;
  bool reject_empty_text_;
};

}  // namespace vault_core
