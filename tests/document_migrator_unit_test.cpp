#include "migration/DocumentMigrator.hpp"
#include "migration/StepRegistry.hpp"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>

struct DocumentMigratorSuite : public ::testing::Test {
  DocumentMigratorSuite() = default;

  void SetUp() override {
  }

  void TearDown() override {
  }

  MigrationResult migrate(Document document, int64_t target) {
    DocumentMigrator migrator{registry, DefaultVersionField, quiet_logger()};

    return run_sync(migrator.migrate(std::move(document), target));
  }

  StepRegistry registry;
};

TEST_F(DocumentMigratorSuite, TransformThenStampOnlyStep) {
  registry.add_step(field_step(1, "x"));
  registry.add_step(MigrationStep{
    2, MigrationStep::SyncTransform{
      [](Document const &) -> std::optional<Document> { return std::nullopt; }}});

  auto result = migrate(Document{"a"}, 2);

  EXPECT_EQ(result.document.get_version(), 2);
  EXPECT_EQ(result.document["x"], Data{1});
  EXPECT_TRUE(result.modified);
  EXPECT_FALSE(result.stalled);
  EXPECT_EQ(result.from_version, 0);
  EXPECT_EQ(result.to_version, 2);
}

TEST_F(DocumentMigratorSuite, DocumentAtOrAboveTargetIsUntouched) {
  registry.add_steps({field_step(1, "x"), field_step(2, "y")});

  Document document{"a"};

  document.set_version(3);

  auto result = migrate(document, 2);

  EXPECT_EQ(result.document, document);
  EXPECT_FALSE(result.modified);
  EXPECT_FALSE(result.stalled);

  result = migrate(Document{"b"}, 0);

  EXPECT_EQ(result.document, Document{"b"});
  EXPECT_FALSE(result.modified);
}

TEST_F(DocumentMigratorSuite, ContiguousChainReachesTargetExactly) {
  for (int64_t id = 1; id <= 5; id++) {
    registry.add_step(stamp_step(id));
  }

  auto result = migrate(Document{"a"}, 5);

  EXPECT_EQ(result.document.get_version(), 5);
  EXPECT_FALSE(result.modified);

  result = migrate(Document{"a"}, 3);

  EXPECT_EQ(result.document.get_version(), 3);
}

TEST_F(DocumentMigratorSuite, MigratingTwiceIsANoOp) {
  registry.add_steps({field_step(1, "x"), field_step(2, "y"), stamp_step(3)});

  auto first = migrate(Document{"a"}, 3);
  auto second = migrate(first.document, 3);

  EXPECT_EQ(second.document, first.document);
  EXPECT_FALSE(second.modified);
}

TEST_F(DocumentMigratorSuite, MissingStepStallsSilently) {
  for (int64_t id = 1; id <= 4; id++) {
    registry.add_step(field_step(id, "x"));
  }

  std::ostringstream output;
  DocumentMigrator migrator{registry, DefaultVersionField, capture_logger(output)};
  Document document{"a"};

  document.set_version(5);

  auto result = run_sync(migrator.migrate(document, 10));

  EXPECT_EQ(result.document, document);
  EXPECT_FALSE(result.modified);
  EXPECT_TRUE(result.stalled);
  EXPECT_EQ(result.to_version, 5);
  EXPECT_NE(output.str().find("warning Document 'a' stuck at v5"), std::string::npos);
}

TEST_F(DocumentMigratorSuite, ModifiedStaysSetAfterStampOnlySteps) {
  registry.add_steps({field_step(1, "x"), stamp_step(2), stamp_step(3)});

  auto result = migrate(Document{"a"}, 3);

  EXPECT_TRUE(result.modified);
  EXPECT_EQ(result.document.get_version(), 3);
}

TEST_F(DocumentMigratorSuite, SparseIdsFollowTheChain) {
  registry.add_steps({field_step(1, "x"), field_step(3, "y")});

  auto result = migrate(Document{"a"}, 3);

  EXPECT_EQ(result.document.get_version(), 3);
  EXPECT_EQ(result.document["y"], Data{3});

  Document gap{"b"};

  gap.set_version(2);

  result = migrate(gap, 3);

  EXPECT_TRUE(result.stalled);
  EXPECT_EQ(result.document.get_version(), 2);
}

TEST_F(DocumentMigratorSuite, AsynchronousTransformIsAwaited) {
  registry.add_step(MigrationStep{
    1, MigrationStep::Transform{
      [](Document const &document) -> boost::asio::awaitable<std::optional<Document> > {
        Document result = document;

        co_await sleep_for(std::chrono::milliseconds{1});

        result["async"] = true;

        co_return result;
      }}});

  auto result = migrate(Document{"a"}, 1);

  EXPECT_EQ(result.document["async"], Data{true});
  EXPECT_EQ(result.document.get_version(), 1);
  EXPECT_TRUE(result.modified);
}

TEST_F(DocumentMigratorSuite, TransformFailurePropagates) {
  registry.add_step(MigrationStep{
    1, MigrationStep::SyncTransform{
      [](Document const &) -> std::optional<Document> {
        throw std::runtime_error("broken step");
      }}});

  EXPECT_THROW(migrate(Document{"a"}, 1), std::runtime_error);
}

TEST_F(DocumentMigratorSuite, CustomVersionField) {
  registry.add_steps({stamp_step(1), stamp_step(2)});

  DocumentMigrator migrator{registry, "schema", quiet_logger()};

  auto result = run_sync(migrator.migrate(Document{"a"}, 2));

  EXPECT_EQ(result.document.get_version("schema"), 2);
  EXPECT_FALSE(result.document.contains(DefaultVersionField));
}
