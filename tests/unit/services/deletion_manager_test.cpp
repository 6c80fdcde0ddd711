#include <gtest/gtest.h>

#include <memory>

#include "../../common/utilities_test.hpp"
#include "vault_core/index/similarity_index.hpp"
#include "vault_core/services/deletion_manager.hpp"

namespace vault_core {

using vault_tests::TestUtilities;

class DeletionManagerTest : public vault_tests::CollectionStoreTestBase {
 protected:
  void SetUp() override {
    CollectionStoreTestBase::SetUp();
    index_ = std::make_shared<FlatIndex>(options_.dimension);
    deletion_manager_ = std::make_unique<DeletionManager>(store_, index_);
  }

  void insert(const Record& record) {
    WriteOutcome outcome = store_->put(record, DuplicatePolicy::Upsert);
    index_->upsert(outcome.row_id, record.id, record.embedding);
  }

  void insert_sources() {
    insert(TestUtilities::create_test_record("b1", TestUtilities::axis_vector(8, 0), "x",
                                             "https://blocked.example/1"));
    insert(TestUtilities::create_test_record("b2", TestUtilities::axis_vector(8, 1), "x",
                                             "https://blocked.example/2"));
    insert(TestUtilities::create_test_record("b3", TestUtilities::axis_vector(8, 2), "x",
                                             "http://cdn.blocked.example/3"));
    insert(TestUtilities::create_test_record("ok1", TestUtilities::axis_vector(8, 3), "x",
                                             "https://allowed.example/1"));
    insert(TestUtilities::create_test_record("ok2", TestUtilities::axis_vector(8, 4), "x",
                                             "https://allowed.example/2"));
  }

  std::shared_ptr<FlatIndex> index_;
  std::unique_ptr<DeletionManager> deletion_manager_;
};

TEST_F(DeletionManagerTest, RemoveReportsWhetherRecordExisted) {
  insert(TestUtilities::create_test_record("a", TestUtilities::axis_vector(8, 0)));

  EXPECT_TRUE(deletion_manager_->remove("a"));
  EXPECT_FALSE(deletion_manager_->remove("a"));
  EXPECT_EQ(store_->size(), 0u);
  EXPECT_EQ(index_->size(), 0u);
}

TEST_F(DeletionManagerTest, RemoveMissingIdLeavesSizeUnchanged) {
  insert_sources();
  EXPECT_FALSE(deletion_manager_->remove("nope"));
  EXPECT_EQ(store_->size(), 5u);
}

TEST_F(DeletionManagerTest, RemoveWhereSourceContains) {
  insert_sources();

  size_t removed = deletion_manager_->remove_where(RecordFilter::source_contains("blocked.example"));

  EXPECT_EQ(removed, 3u);
  EXPECT_EQ(store_->size(), 2u);
  EXPECT_EQ(index_->size(), 2u);
  EXPECT_TRUE(store_->get("ok1").has_value());
}

TEST_F(DeletionManagerTest, RemoveWhereWithoutMatchesIsNotAnError) {
  insert_sources();
  EXPECT_EQ(deletion_manager_->remove_where(RecordFilter::source_contains("nowhere.example")), 0u);
  EXPECT_EQ(store_->size(), 5u);
}

TEST_F(DeletionManagerTest, RemoveWhereRejectsEmptyFilters) {
  insert_sources();
  EXPECT_THROW(deletion_manager_->remove_where(RecordFilter()), InvalidArgumentError);
  EXPECT_THROW(deletion_manager_->remove_where(RecordFilter::source_contains("")),
               InvalidArgumentError);
  EXPECT_EQ(store_->size(), 5u);
}

TEST_F(DeletionManagerTest, RemoveWhereByMetadata) {
  insert(TestUtilities::create_test_record("p1", TestUtilities::axis_vector(8, 0), "x", "",
                                           {{"page", int64_t{1}}}));
  insert(TestUtilities::create_test_record("p2", TestUtilities::axis_vector(8, 1), "x", "",
                                           {{"page", int64_t{2}}}));

  EXPECT_EQ(deletion_manager_->remove_where(RecordFilter::metadata_equals("page", int64_t{2})), 1u);
  EXPECT_TRUE(store_->get("p1").has_value());
  EXPECT_FALSE(store_->get("p2").has_value());
}

TEST_F(DeletionManagerTest, RemoveBySourceIsExact) {
  insert_sources();
  EXPECT_EQ(deletion_manager_->remove_by_source("https://blocked.example/1"), 1u);
  EXPECT_EQ(store_->size(), 4u);
  EXPECT_THROW(deletion_manager_->remove_by_source(""), InvalidArgumentError);
}

TEST_F(DeletionManagerTest, ClearRemovesEverything) {
  insert_sources();
  EXPECT_EQ(deletion_manager_->clear(), 5u);
  EXPECT_EQ(store_->size(), 0u);
  EXPECT_EQ(index_->size(), 0u);
  EXPECT_EQ(deletion_manager_->clear(), 0u);
}

}  // namespace vault_core
