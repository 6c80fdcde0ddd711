#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "vault_core/collection_options.hpp"

namespace vault_core {

class Config {
 public:
  CollectionOptions collection;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;
    CollectionOptions& c = config.collection;

    // Apply defaults when keys are missing
    c.storage_path = json_config.value("storage_path", std::string("./data/vault"));
    c.collection_name = json_config.value("collection_name", std::string("research_chunks"));
    c.reject_empty_text = json_config.value("reject_empty_text", false);

    try {
      c.duplicate_policy =
          duplicate_policy_from_string(json_config.value("duplicate_policy", std::string("upsert")));
      c.index_type = index_type_from_string(json_config.value("index_type", std::string("flat")));
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(e.what());
    }

    // Integers keep their default when the wrong type is provided
    int dimension = int_or_default(json_config, "dimension", 384);
    if (dimension <= 0) {
      throw std::runtime_error("dimension must be greater than 0");
    }
    c.dimension = static_cast<size_t>(dimension);
    c.pool_size = int_or_default(json_config, "pool_size", 4);
    int chunk = int_or_default(json_config, "batch_chunk_size", 500);
    if (chunk <= 0) {
      throw std::runtime_error("batch_chunk_size must be greater than 0");
    }
    c.batch_chunk_size = static_cast<size_t>(chunk);

    config.validate();
    return config;
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<int>();
      }
    } catch (const std::exception&) {
    }
    return fallback;
  }

  void validate() const {
    if (collection.storage_path.empty()) {
      throw std::runtime_error("storage_path cannot be empty");
    }
    if (collection.collection_name.empty()) {
      throw std::runtime_error("collection_name cannot be empty");
    }
    if (collection.dimension == 0) {
      throw std::runtime_error("dimension must be greater than 0");
    }
    if (collection.pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
  }
};

}  // namespace vault_core
