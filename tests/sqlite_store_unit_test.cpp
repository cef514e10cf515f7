#include "migration/MigrationOrchestrator.hpp"
#include "migration/StepSource.hpp"
#include "store/SqliteDocumentStore.hpp"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include <SQLiteCpp/SQLiteCpp.h>

struct SqliteStoreSuite : public ::testing::Test {
  SqliteStoreSuite() = default;

  void SetUp() override {
    std::filesystem::remove(path);
  }

  void TearDown() override {
    std::filesystem::remove(path);
  }

  std::string const path =
    (std::filesystem::temp_directory_path() / "docmig_sqlite_store_unit_test.db").string();
};

TEST_F(SqliteStoreSuite, RoundTripsEveryKind) {
  SqliteDocumentStore store{":memory:"};
  Document document{"a"};

  document["none"] = nullptr;
  document["flag"] = true;
  document["count"] = 42;
  document["ratio"] = 0.25;
  document["name"] = "first";
  document.set_version(3);

  run_sync(store.upsert(document));

  auto loaded = store.find("a");

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded.value(), document);
  EXPECT_EQ(loaded->operator[]("flag").get_kind(), DataKind::Bool);
  EXPECT_FALSE(store.find("b").has_value());
}

TEST_F(SqliteStoreSuite, UpsertReplacesEveryField) {
  SqliteDocumentStore store{":memory:"};

  run_sync(store.upsert(Document{"a"}.set("old", 1)));
  run_sync(store.upsert(Document{"a"}.set("new", 2)));

  auto loaded = store.find("a").value();

  EXPECT_FALSE(loaded.contains("old"));
  EXPECT_EQ(loaded["new"], Data{2});
}

TEST_F(SqliteStoreSuite, QueriesFollowVersionThenIdOrder) {
  SqliteDocumentStore store{":memory:"};

  run_sync(store.upsert(Document{"c"}.set(DefaultVersionField, 1)));
  run_sync(store.upsert(Document{"b"}));
  run_sync(store.upsert(Document{"a"}.set(DefaultVersionField, 1)));
  run_sync(store.upsert(Document{"d"}.set(DefaultVersionField, 2)));

  auto rows = run_sync(store.query_by_version(VersionQuery{2, {}, {}, true}));

  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].id, "b");
  EXPECT_EQ(rows[1].id, "a");
  EXPECT_EQ(rows[2].id, "c");
  EXPECT_EQ(rows[2].version, 1);
  EXPECT_TRUE(rows[2].document.has_value());

  rows = run_sync(store.query_by_version(VersionQuery{3, 2, RowKey{1, "a"}, false}));

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].id, "c");
  EXPECT_EQ(rows[1].id, "d");
  EXPECT_FALSE(rows[0].document.has_value());

  EXPECT_EQ(run_sync(store.count_by_version(2)), 3u);
  EXPECT_EQ(run_sync(store.count_by_version(0)), 0u);
}

TEST_F(SqliteStoreSuite, UndecodableCellYieldsMalformedRow) {
  {
    SqliteDocumentStore store{path};

    run_sync(store.upsert(Document{"a"}.set("x", 1)));
  }

  {
    SQLite::Database db(path, SQLite::OPEN_READWRITE);

    db.exec("UPDATE document_fields SET kind = 9 WHERE name = 'x';");
  }

  SqliteDocumentStore store{path};
  auto rows = run_sync(store.query_by_version(VersionQuery{1, {}, {}, true}));

  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].id, "a");
  EXPECT_FALSE(rows[0].document.has_value());
}

TEST_F(SqliteStoreSuite, MigratesStoredDocuments) {
  auto store = std::make_shared<SqliteDocumentStore>(path);

  for (int i = 0; i < 40; i++) {
    run_sync(store->upsert(Document{fmt::format("doc-{:02}", i)}.set("index", i)));
  }

  boost::asio::io_context context;
  MigrationConfig config;

  config.page_size = 16;

  MigrationOrchestrator orchestrator{
    context.get_executor(), store,
    std::make_shared<StaticStepSource>(std::vector<MigrationStep>{
      field_step(1, "x"), stamp_step(2)}),
    config, quiet_logger()};

  auto summary = run_sync(context, orchestrator.run_migrations());

  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->done, 40u);
  EXPECT_EQ(summary->written, 40u);
  EXPECT_EQ(run_sync(store->count_by_version(2)), 0u);

  auto document = store->find("doc-17").value();

  EXPECT_EQ(document.get_version(), 2);
  EXPECT_EQ(document["x"], Data{1});
  EXPECT_EQ(document["index"], Data{17});
}

TEST_F(SqliteStoreSuite, FailedUpsertIsRolledBack) {
  SqliteDocumentStore store{path};

  {
    SQLite::Database db(path, SQLite::OPEN_READWRITE);

    db.exec("DROP TABLE document_fields;");
  }

  try {
    run_sync(store.upsert(Document{"a"}.set("x", 1)));

    FAIL() << "upsert should fail without the fields table";
  } catch (std::runtime_error &e) {
    EXPECT_NE(std::string{e.what()}.find("document_fields"), std::string::npos);
  }

  EXPECT_EQ(run_sync(store.count_by_version(1)), 0u);
}
