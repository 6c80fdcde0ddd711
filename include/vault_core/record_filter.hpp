#pragma once

#include <string>
#include <variant>
#include <vector>

#include "vault_core/types/record.hpp"

namespace vault_core {

struct SourceEquals {
  std::string source_reference;
};

struct SourceContains {
  std::string fragment;
};

struct MetadataEquals {
  std::string key;
  MetadataValue value;
};

struct EmbeddingModelEquals {
  std::string embedding_model_id;
};

using FilterClause = std::variant<SourceEquals, SourceContains, MetadataEquals, EmbeddingModelEquals>;

// Conjunction of clauses evaluated against the non-vector fields of a record.
// An empty filter matches every record.
class RecordFilter {
 public:
  RecordFilter() = default;

  static RecordFilter source_equals(const std::string &source_reference);
  static RecordFilter source_contains(const std::string &fragment);
  static RecordFilter metadata_equals(const std::string &key, const MetadataValue &value);
  static RecordFilter embedding_model_equals(const std::string &embedding_model_id);

  RecordFilter &and_also(FilterClause clause);

  bool matches(const std::string &source_reference, const Metadata &metadata,
               const std::string &embedding_model_id) const;
  bool matches(const Record &record) const;

  bool empty() const {
    return clauses_.empty();
  }
  const std::vector<FilterClause> &clauses() const {
    return clauses_;
  }

  std::string describe() const;

 private:
  std::vector<FilterClause> clauses_;
};

}  // namespace vault_core
