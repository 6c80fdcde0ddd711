#pragma once

#include <nlohmann/json.hpp>

#include "vault_core/types/record.hpp"

namespace nlohmann {

// MetadataValue is a std::variant, so ADL cannot find a to_json in vault_core.
template <>
struct adl_serializer<vault_core::MetadataValue> {
  static void to_json(json &j, const vault_core::MetadataValue &value);
  static void from_json(const json &j, vault_core::MetadataValue &value);
};

}  // namespace nlohmann

namespace vault_core {

void to_json(nlohmann::json &j, const Record &record);
// created_at is taken from "created_at_us" when present.
void from_json(const nlohmann::json &j, Record &record);

void to_json(nlohmann::json &j, const SearchResult &result);
void to_json(nlohmann::json &j, const CollectionStats &stats);
void to_json(nlohmann::json &j, const HealthReport &report);

// Converts arbitrary JSON objects into flat metadata. Nested values are kept
// as their serialized text, nulls are dropped.
Metadata metadata_from_loose_json(const nlohmann::json &j);

std::string serialize_metadata(const Metadata &metadata);
Metadata deserialize_metadata(const std::string &text);

}  // namespace vault_core
