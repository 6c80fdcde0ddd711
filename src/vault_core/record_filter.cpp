#include "vault_core/record_filter.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

#include "vault_core/record_json.hpp"

namespace vault_core {

namespace {

template <class>
inline constexpr bool always_false_v = false;

bool clause_matches(const FilterClause &clause, const std::string &source_reference,
                    const Metadata &metadata, const std::string &embedding_model_id) {
  return std::visit(
      [&](const auto &c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, SourceEquals>) {
          return source_reference == c.source_reference;
        } else if constexpr (std::is_same_v<T, SourceContains>) {
          return source_reference.find(c.fragment) != std::string::npos;
        } else if constexpr (std::is_same_v<T, MetadataEquals>) {
          auto it = metadata.find(c.key);
          return it != metadata.end() && it->second == c.value;
        } else if constexpr (std::is_same_v<T, EmbeddingModelEquals>) {
          return embedding_model_id == c.embedding_model_id;
        } else {
          static_assert(always_false_v<T>, "unhandled filter clause");
        }
      },
      clause);
}

}  // namespace

RecordFilter RecordFilter::source_equals(const std::string &source_reference) {
  return RecordFilter().and_also(SourceEquals{source_reference});
}

RecordFilter RecordFilter::source_contains(const std::string &fragment) {
  return RecordFilter().and_also(SourceContains{fragment});
}

RecordFilter RecordFilter::metadata_equals(const std::string &key, const MetadataValue &value) {
  return RecordFilter().and_also(MetadataEquals{key, value});
}

RecordFilter RecordFilter::embedding_model_equals(const std::string &embedding_model_id) {
  return RecordFilter().and_also(EmbeddingModelEquals{embedding_model_id});
}

RecordFilter &RecordFilter::and_also(FilterClause clause) {
  clauses_.push_back(std::move(clause));
  return *this;
}

bool RecordFilter::matches(const std::string &source_reference, const Metadata &metadata,
                           const std::string &embedding_model_id) const {
  for (const auto &clause : clauses_) {
    if (!clause_matches(clause, source_reference, metadata, embedding_model_id)) {
      return false;
    }
  }
  return true;
}

bool RecordFilter::matches(const Record &record) const {
  return matches(record.source_reference, record.metadata, record.embedding_model_id);
}

std::string RecordFilter::describe() const {
  if (clauses_.empty()) {
    return "<all>";
  }
  std::stringstream ss;
  for (size_t i = 0; i < clauses_.size(); ++i) {
    if (i > 0)
      ss << " AND ";
    std::visit(
        [&](const auto &c) {
          using T = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<T, SourceEquals>) {
            ss << "source == '" << c.source_reference << "'";
          } else if constexpr (std::is_same_v<T, SourceContains>) {
            ss << "source contains '" << c.fragment << "'";
          } else if constexpr (std::is_same_v<T, MetadataEquals>) {
            ss << "metadata[" << c.key << "] == " << nlohmann::json(c.value).dump();
          } else {
            ss << "embedding_model == '" << c.embedding_model_id << "'";
          }
        },
        clauses_[i]);
  }
  return ss.str();
}

}  // namespace vault_core
