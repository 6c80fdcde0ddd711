#include "vault_core/record_json.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace nlohmann {

void adl_serializer<vault_core::MetadataValue>::to_json(json &j,
                                                        const vault_core::MetadataValue &value) {
  std::visit([&](const auto &v) { j = v; }, value);
}

void adl_serializer<vault_core::MetadataValue>::from_json(const json &j,
                                                          vault_core::MetadataValue &value) {
  if (j.is_boolean()) {
    value = j.get<bool>();
  } else if (j.is_number_unsigned()) {
    auto number = j.get<uint64_t>();
    if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw std::out_of_range("Metadata integer " + std::to_string(number) +
                              " does not fit in a signed 64-bit value");
    }
    value = static_cast<int64_t>(number);
  } else if (j.is_number_integer()) {
    value = j.get<int64_t>();
  } else if (j.is_number_float()) {
    value = j.get<double>();
  } else if (j.is_string()) {
    value = j.get<std::string>();
  } else {
    throw std::invalid_argument("Metadata values must be strings, numbers or booleans, got " +
                                std::string(j.type_name()));
  }
}

}  // namespace nlohmann

namespace vault_core {

void to_json(nlohmann::json &j, const Record &record) {
  j = nlohmann::json{{"id", record.id},
                     {"text", record.text},
                     {"source_reference", record.source_reference},
                     {"metadata", record.metadata},
                     {"embedding", record.embedding},
                     {"embedding_model_id", record.embedding_model_id},
                     {"created_at_us", to_unix_micros(record.created_at)}};
}

void from_json(const nlohmann::json &j, Record &record) {
  record.id = j.at("id").get<std::string>();
  record.text = j.value("text", std::string());
  record.source_reference = j.value("source_reference", std::string());
  record.metadata = j.contains("metadata") ? metadata_from_loose_json(j.at("metadata")) : Metadata{};
  record.embedding = j.at("embedding").get<std::vector<float>>();
  record.embedding_model_id = j.value("embedding_model_id", std::string());
  if (j.contains("created_at_us")) {
    record.created_at = from_unix_micros(j.at("created_at_us").get<int64_t>());
  }
}

void to_json(nlohmann::json &j, const SearchResult &result) {
  j = nlohmann::json{{"rank", result.rank},
                     {"id", result.id},
                     {"score", result.score},
                     {"text", result.text},
                     {"source_reference", result.source_reference},
                     {"metadata", result.metadata}};
}

void to_json(nlohmann::json &j, const CollectionStats &stats) {
  j = nlohmann::json{{"collection_name", stats.collection_name},
                     {"dimension", stats.dimension},
                     {"total_records", stats.total_records},
                     {"unique_sources", stats.unique_sources},
                     {"embedding_models", stats.embedding_models},
                     {"total_characters", stats.total_characters},
                     {"average_text_length", stats.average_text_length},
                     {"index_type", stats.index_type}};
}

void to_json(nlohmann::json &j, const HealthReport &report) {
  j = nlohmann::json{{"status", report.healthy ? "healthy" : "unhealthy"},
                     {"collection_size", report.collection_size},
                     {"generation", report.generation},
                     {"query_embedder_configured", report.query_embedder_configured},
                     {"storage_path", report.storage_path},
                     {"collection_name", report.collection_name},
                     {"dimension", report.dimension},
                     {"checked_at_us", to_unix_micros(report.checked_at)}};
  if (!report.healthy) {
    j["error"] = report.error;
  }
}

Metadata metadata_from_loose_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("metadata must be a JSON object");
  }
  Metadata metadata;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto &value = it.value();
    if (value.is_null()) {
      continue;
    }
    if (value.is_structured()) {
      metadata[it.key()] = value.dump();
    } else {
      metadata[it.key()] = value.get<MetadataValue>();
    }
  }
  return metadata;
}

std::string serialize_metadata(const Metadata &metadata) {
  return nlohmann::json(metadata).dump();
}

Metadata deserialize_metadata(const std::string &text) {
  return nlohmann::json::parse(text).get<Metadata>();
}

}  // namespace vault_core
