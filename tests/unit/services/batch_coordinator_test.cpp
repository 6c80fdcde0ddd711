#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <memory>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "vault_core/index/similarity_index.hpp"
#include "vault_core/services/batch_coordinator.hpp"
#include "vault_core/vector_engine.hpp"

namespace vault_core {

using vault_tests::TestUtilities;

class BatchCoordinatorTest : public vault_tests::CollectionStoreTestBase {
 protected:
  void SetUp() override {
    CollectionStoreTestBase::SetUp();
    index_ = std::make_shared<FlatIndex>(options_.dimension);
  }

  std::unique_ptr<BatchCoordinator> make_coordinator(DuplicatePolicy policy,
                                                     size_t chunk_size = 500) {
    return std::make_unique<BatchCoordinator>(
        store_, index_, RecordValidator(options_.dimension, false), policy, chunk_size);
  }

  std::shared_ptr<FlatIndex> index_;
};

TEST_F(BatchCoordinatorTest, AddWritesStoreAndIndex) {
  auto coordinator = make_coordinator(DuplicatePolicy::Upsert);
  auto record = TestUtilities::create_test_record("a", TestUtilities::axis_vector(8, 0));

  PutResult result = coordinator->add(record);

  EXPECT_FALSE(result.replaced);
  EXPECT_EQ(store_->size(), 1u);
  EXPECT_EQ(index_->size(), 1u);
  ASSERT_TRUE(store_->get("a").has_value());
  EXPECT_EQ(store_->get("a")->created_at, result.created_at);
}

TEST_F(BatchCoordinatorTest, AddThrowsOnInvalidRecordAndWritesNothing) {
  auto coordinator = make_coordinator(DuplicatePolicy::Upsert);
  auto record = TestUtilities::create_test_record("a", {1.0f, 2.0f});

  EXPECT_THROW(coordinator->add(record), DimensionMismatchError);
  EXPECT_EQ(store_->size(), 0u);
  EXPECT_EQ(index_->size(), 0u);
}

TEST_F(BatchCoordinatorTest, BatchIsolatesInvalidRecords) {
  auto coordinator = make_coordinator(DuplicatePolicy::Upsert);
  auto records = TestUtilities::create_test_dataset(5, options_.dimension);
  records[2].embedding = {1.0f, 2.0f, 3.0f};

  BatchResult result = coordinator->add_batch(records);

  EXPECT_EQ(result.inserted, 4u);
  ASSERT_EQ(result.rejected.size(), 1u);
  EXPECT_EQ(result.rejected[0].id, records[2].id);
  EXPECT_EQ(result.rejected[0].kind, ErrorKind::DimensionMismatch);
  EXPECT_EQ(store_->size(), 4u);
  EXPECT_EQ(index_->size(), 4u);
  EXPECT_FALSE(store_->get(records[2].id).has_value());
}

TEST_F(BatchCoordinatorTest, BatchCountsReplacementsUnderUpsert) {
  auto coordinator = make_coordinator(DuplicatePolicy::Upsert);
  auto records = TestUtilities::create_test_dataset(3, options_.dimension);
  coordinator->add_batch(records);

  records[1].text = "updated";
  BatchResult result = coordinator->add_batch(records);

  EXPECT_EQ(result.inserted, 3u);
  EXPECT_EQ(result.replaced, 3u);
  EXPECT_TRUE(result.rejected.empty());
  EXPECT_EQ(store_->size(), 3u);
  EXPECT_EQ(store_->get(records[1].id)->text, "updated");
}

TEST_F(BatchCoordinatorTest, RejectPolicyReportsDuplicates) {
  auto coordinator = make_coordinator(DuplicatePolicy::Reject);
  auto records = TestUtilities::create_test_dataset(2, options_.dimension);
  coordinator->add(records[0]);

  BatchResult result = coordinator->add_batch(records);

  EXPECT_EQ(result.inserted, 1u);
  ASSERT_EQ(result.rejected.size(), 1u);
  EXPECT_EQ(result.rejected[0].id, records[0].id);
  EXPECT_EQ(result.rejected[0].kind, ErrorKind::DuplicateIdentifier);
  EXPECT_THROW(coordinator->add(records[1]), DuplicateIdentifierError);
}

TEST_F(BatchCoordinatorTest, DuplicateIdsInsideOneBatchUnderRejectKeepFirst) {
  auto coordinator = make_coordinator(DuplicatePolicy::Reject);
  auto first = TestUtilities::create_test_record("dup", TestUtilities::axis_vector(8, 0), "first");
  auto second = TestUtilities::create_test_record("dup", TestUtilities::axis_vector(8, 1), "second");

  BatchResult result = coordinator->add_batch({first, second});

  EXPECT_EQ(result.inserted, 1u);
  ASSERT_EQ(result.rejected.size(), 1u);
  EXPECT_EQ(store_->get("dup")->text, "first");
}

TEST_F(BatchCoordinatorTest, SmallChunksWriteEverything) {
  auto coordinator = make_coordinator(DuplicatePolicy::Upsert, /*chunk_size*/ 2);
  auto records = TestUtilities::create_test_dataset(7, options_.dimension);

  BatchResult result = coordinator->add_batch(records);

  EXPECT_EQ(result.inserted, 7u);
  EXPECT_EQ(store_->size(), 7u);
  EXPECT_EQ(index_->size(), 7u);
}

TEST_F(BatchCoordinatorTest, EmptyBatchIsNoOp) {
  auto coordinator = make_coordinator(DuplicatePolicy::Upsert);
  int64_t generation = store_->generation();

  BatchResult result = coordinator->add_batch({});

  EXPECT_EQ(result.inserted, 0u);
  EXPECT_TRUE(result.rejected.empty());
  EXPECT_EQ(store_->generation(), generation);
}

TEST_F(BatchCoordinatorTest, FailedChunkIsReportedAndLaterChunksStillWrite) {
  {
    // Aborts any insert of rec_3 from a separate connection's schema change
    sqlite::database raw((storage_root_ / VectorEngine::DATABASE_FILE).string());
    raw << "CREATE TRIGGER fail_rec_3 BEFORE INSERT ON records WHEN NEW.id = 'rec_3' "
           "BEGIN SELECT RAISE(ABORT, 'simulated write failure'); END;";
  }
  auto coordinator = make_coordinator(DuplicatePolicy::Upsert, /*chunk_size*/ 2);
  auto records = TestUtilities::create_test_dataset(6, options_.dimension);

  BatchResult result = coordinator->add_batch(records);

  // Chunks are [rec_0, rec_1], [rec_2, rec_3], [rec_4, rec_5]
  EXPECT_EQ(result.inserted, 4u);
  ASSERT_EQ(result.rejected.size(), 2u);
  EXPECT_EQ(result.rejected[0].id, "rec_2");
  EXPECT_EQ(result.rejected[1].id, "rec_3");
  for (const auto& rejected : result.rejected) {
    EXPECT_EQ(rejected.kind, ErrorKind::Storage);
    EXPECT_NE(rejected.message.find("put_many"), std::string::npos);
  }

  EXPECT_EQ(store_->size(), 4u);
  EXPECT_EQ(index_->size(), 4u);
  for (const char* id : {"rec_0", "rec_1", "rec_4", "rec_5"}) {
    EXPECT_TRUE(store_->get(id).has_value()) << id;
  }
  EXPECT_FALSE(store_->get("rec_2").has_value());
}

TEST_F(BatchCoordinatorTest, DuplicatesInFailedChunkAreReportedOnce) {
  auto coordinator = make_coordinator(DuplicatePolicy::Reject, /*chunk_size*/ 3);
  auto records = TestUtilities::create_test_dataset(3, options_.dimension);
  coordinator->add(records[0]);
  {
    sqlite::database raw((storage_root_ / VectorEngine::DATABASE_FILE).string());
    raw << "CREATE TRIGGER fail_rec_2 BEFORE INSERT ON records WHEN NEW.id = 'rec_2' "
           "BEGIN SELECT RAISE(ABORT, 'simulated write failure'); END;";
  }

  BatchResult result = coordinator->add_batch(records);

  EXPECT_EQ(result.inserted, 0u);
  ASSERT_EQ(result.rejected.size(), 3u);
  for (const auto& rejected : result.rejected) {
    EXPECT_EQ(rejected.kind, ErrorKind::Storage);
  }
  EXPECT_EQ(store_->size(), 1u);
}

}  // namespace vault_core
