#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "vault_core/collection_options.hpp"
#include "vault_core/db/collection_store.hpp"
#include "vault_core/db/database_manager.hpp"
#include "vault_core/types/record.hpp"
#include "vault_core/vector_engine.hpp"

namespace vault_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Storage utilities
  static std::filesystem::path create_temp_storage_root();
  static void cleanup_temp_storage(const std::filesystem::path& root);

  // Test data creation
  static std::vector<float> create_test_vector(const std::string& seed_text, size_t dimension);
  // Unit vector along one axis
  static std::vector<float> axis_vector(size_t dimension, size_t axis);

  static vault_core::Record create_test_record(const std::string& id,
                                               const std::vector<float>& embedding,
                                               const std::string& text = "test text",
                                               const std::string& source_reference = "",
                                               const vault_core::Metadata& metadata = {});

  static std::vector<vault_core::Record> create_test_dataset(int count, size_t dimension,
                                                             const std::string& prefix = "rec");

  static vault_core::CollectionOptions create_test_options(const std::filesystem::path& root,
                                                           size_t dimension = 8);
};

/**
 * Base fixture owning a fresh storage root per test
 */
class StorageTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    storage_root_ = TestUtilities::create_temp_storage_root();
    options_ = TestUtilities::create_test_options(storage_root_);
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_storage(storage_root_);
  }

  std::filesystem::path storage_root_;
  vault_core::CollectionOptions options_;
};

/**
 * Fixture for tests working directly against a CollectionStore
 */
class CollectionStoreTestBase : public StorageTestBase {
 protected:
  void SetUp() override {
    StorageTestBase::SetUp();
    open_store();
  }

  void TearDown() override {
    close_store();
    StorageTestBase::TearDown();
  }

  void open_store() {
    db_manager_ = std::make_shared<vault_core::DatabaseManager>();
    db_manager_->initialize(storage_root_ / vault_core::VectorEngine::DATABASE_FILE,
                            options_.pool_size);
    store_ = std::make_shared<vault_core::CollectionStore>(db_manager_, options_);
  }

  void close_store() {
    store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
    }
  }

  std::shared_ptr<vault_core::DatabaseManager> db_manager_;
  std::shared_ptr<vault_core::CollectionStore> store_;
};

/**
 * Fixture providing an open VectorEngine over a temp storage root
 */
class VectorEngineTestBase : public StorageTestBase {
 protected:
  void SetUp() override {
    StorageTestBase::SetUp();
    engine_ = std::make_unique<vault_core::VectorEngine>(options_);
    engine_->open();
  }

  void TearDown() override {
    if (engine_) {
      engine_->close();
      engine_.reset();
    }
    StorageTestBase::TearDown();
  }

  // Closes the current engine and opens a new one over the same root
  void reopen() {
    engine_->close();
    engine_ = std::make_unique<vault_core::VectorEngine>(options_);
    engine_->open();
  }

  std::unique_ptr<vault_core::VectorEngine> engine_;
};

}  // namespace vault_tests
