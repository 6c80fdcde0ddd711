#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <limits>
#include <stdexcept>

#include "vault_core/record_json.hpp"

namespace vault_core {

TEST(RecordJsonTest, RecordFromJsonAppliesDefaults) {
  auto j = nlohmann::json::parse(R"({"id": "c1", "embedding": [0.5, 1.0]})");
  Record record = j.get<Record>();

  EXPECT_EQ(record.id, "c1");
  EXPECT_EQ(record.text, "");
  EXPECT_EQ(record.source_reference, "");
  EXPECT_TRUE(record.metadata.empty());
  EXPECT_EQ(record.embedding, (std::vector<float>{0.5f, 1.0f}));
}

TEST(RecordJsonTest, RecordFromJsonRequiresIdAndEmbedding) {
  EXPECT_ANY_THROW(nlohmann::json::parse(R"({"embedding": [1.0]})").get<Record>());
  EXPECT_ANY_THROW(nlohmann::json::parse(R"({"id": "c1"})").get<Record>());
}

TEST(RecordJsonTest, RecordJsonKeepsCreatedAtMicroseconds) {
  Record record;
  record.id = "c1";
  record.embedding = {1.0f};
  record.created_at = from_unix_micros(1700000000123456);

  nlohmann::json j = record;
  EXPECT_EQ(j.at("created_at_us").get<int64_t>(), 1700000000123456);
  EXPECT_EQ(j.get<Record>(), record);
}

TEST(RecordJsonTest, LooseMetadataFlattensNestedValues) {
  auto j = nlohmann::json::parse(
      R"({"title": "Paper", "year": 2021, "score": 0.75, "open": false,
          "authors": ["A", "B"], "missing": null})");
  Metadata metadata = metadata_from_loose_json(j);

  EXPECT_EQ(std::get<std::string>(metadata.at("title")), "Paper");
  EXPECT_EQ(std::get<int64_t>(metadata.at("year")), 2021);
  EXPECT_DOUBLE_EQ(std::get<double>(metadata.at("score")), 0.75);
  EXPECT_FALSE(std::get<bool>(metadata.at("open")));
  EXPECT_EQ(std::get<std::string>(metadata.at("authors")), R"(["A","B"])");
  EXPECT_EQ(metadata.count("missing"), 0u);
}

TEST(RecordJsonTest, MetadataIntegersBeyondSignedRangeAreRejected) {
  auto fits = nlohmann::json::parse(R"({"big": 9223372036854775807})");
  EXPECT_EQ(std::get<int64_t>(metadata_from_loose_json(fits).at("big")),
            std::numeric_limits<int64_t>::max());

  auto too_big = nlohmann::json::parse(R"({"big": 9223372036854775808})");
  ASSERT_TRUE(too_big.at("big").is_number_unsigned());
  EXPECT_THROW(metadata_from_loose_json(too_big), std::out_of_range);
}

TEST(RecordJsonTest, LooseMetadataRequiresObject) {
  EXPECT_THROW(metadata_from_loose_json(nlohmann::json::array()), std::invalid_argument);
}

TEST(RecordJsonTest, MetadataColumnPreservesValueTypes) {
  Metadata metadata{{"page", int64_t{7}}, {"ratio", 2.0}, {"flag", true},
                    {"name", std::string("x")}};
  Metadata restored = deserialize_metadata(serialize_metadata(metadata));

  EXPECT_EQ(restored, metadata);
  EXPECT_TRUE(std::holds_alternative<double>(restored.at("ratio")));
  EXPECT_TRUE(std::holds_alternative<int64_t>(restored.at("page")));
}

TEST(RecordJsonTest, SearchResultJsonCarriesRankAndScore) {
  SearchResult result;
  result.id = "c1";
  result.score = 0.5f;
  result.rank = 1;
  nlohmann::json j = result;

  EXPECT_EQ(j.at("rank").get<int>(), 1);
  EXPECT_FLOAT_EQ(j.at("score").get<float>(), 0.5f);
  EXPECT_FALSE(j.contains("embedding"));
}

}  // namespace vault_core
