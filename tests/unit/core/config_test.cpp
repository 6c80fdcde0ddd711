#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <stdexcept>
#include <unistd.h>

#include "vault_core/config.hpp"

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/vault_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

namespace vault_core {

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"storage_path", "./data/papers"},
      {"collection_name", "papers"},
      {"dimension", 768},
      {"reject_empty_text", true},
      {"duplicate_policy", "reject"},
      {"index_type", "faiss"},
      {"pool_size", 2},
      {"batch_chunk_size", 100}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.collection.storage_path.string(), "./data/papers");
  EXPECT_EQ(cfg.collection.collection_name, "papers");
  EXPECT_EQ(cfg.collection.dimension, 768u);
  EXPECT_TRUE(cfg.collection.reject_empty_text);
  EXPECT_EQ(cfg.collection.duplicate_policy, DuplicatePolicy::Reject);
  EXPECT_EQ(cfg.collection.index_type, IndexType::Faiss);
  EXPECT_EQ(cfg.collection.pool_size, 2);
  EXPECT_EQ(cfg.collection.batch_chunk_size, 100u);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.collection.storage_path.string(), "./data/vault");
  EXPECT_EQ(cfg.collection.collection_name, "research_chunks");
  EXPECT_EQ(cfg.collection.dimension, 384u);
  EXPECT_FALSE(cfg.collection.reject_empty_text);
  EXPECT_EQ(cfg.collection.duplicate_policy, DuplicatePolicy::Upsert);
  EXPECT_EQ(cfg.collection.index_type, IndexType::Flat);
  EXPECT_EQ(cfg.collection.batch_chunk_size, 500u);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "storage_path": "/var/lib/vault",
    "dimension": 1024,
    "index_type": "flat"
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (const std::exception&) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.collection.storage_path.string(), "/var/lib/vault");
  EXPECT_EQ(cfg.collection.dimension, 1024u);
}

TEST(ConfigTest, MalformedFileThrows) {
  std::string path = write_temp_file("{ \"dimension\": ");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"storage_path", ""}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"collection_name", ""}}); }, std::runtime_error);
}

TEST(ConfigTest, NonPositiveNumbersThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"dimension", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"dimension", -3}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"pool_size", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"batch_chunk_size", 0}}); }, std::runtime_error);
}

TEST(ConfigTest, UnknownEnumValuesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"duplicate_policy", "merge"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"index_type", "ivf"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"index_type", "hnsw"}}); }, std::runtime_error);
}

TEST(ConfigTest, WrongTypedIntegerFallsBackToDefault) {
  Config cfg = Config::from_json({{"dimension", "large"}});
  EXPECT_EQ(cfg.collection.dimension, 384u);
}

}  // namespace vault_core
