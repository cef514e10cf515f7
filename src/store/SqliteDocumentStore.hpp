#pragma once

#include "store/DocumentStore.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <SQLiteCpp/SQLiteCpp.h>

#include <fmt/format.h>

/*
  Documents are kept in two tables: 'documents' holds the identity and a
  copy of the version marker (indexed for the version view) and
  'document_fields' holds one typed cell per field.
*/
struct SqliteDocumentStore : public DocumentStore {
  inline static std::string const Tag = "SqliteDocumentStore";

  explicit SqliteDocumentStore(std::string const &dbName,
                               std::string versionField = DefaultVersionField)
    : mDb(dbName, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
      mVersionField{std::move(versionField)} {
    execute("CREATE TABLE IF NOT EXISTS documents ("
            "id TEXT NOT NULL PRIMARY KEY, "
            "version INTEGER NOT NULL DEFAULT 0);");
    execute("CREATE INDEX IF NOT EXISTS documents_by_version "
            "ON documents (version, id);");
    execute("CREATE TABLE IF NOT EXISTS document_fields ("
            "document_id TEXT NOT NULL, "
            "name TEXT NOT NULL, "
            "kind INTEGER NOT NULL, "
            "value BLOB, "
            "PRIMARY KEY (document_id, name));");
  }

  virtual ~SqliteDocumentStore() = default;

  boost::asio::awaitable<std::vector<DocumentRow> >
    query_by_version(VersionQuery query) override {
    std::scoped_lock lock(mMutex);
    std::vector<DocumentRow> rows;
    std::string sql = "SELECT id, version FROM documents WHERE version < ?";

    if (query.start_after.has_value()) {
      sql += " AND (version > ? OR (version = ? AND id > ?))";
    }

    sql += " ORDER BY version, id";

    if (query.limit.has_value()) {
      sql += " LIMIT ?";
    }

    guarded(sql, [&]() {
      SQLite::Statement statement(mDb, sql);
      int index = 1;

      statement.bind(index++, static_cast<int64_t>(query.end_version));

      if (query.start_after.has_value()) {
        statement.bind(index++, static_cast<int64_t>(query.start_after->version));
        statement.bind(index++, static_cast<int64_t>(query.start_after->version));
        statement.bind(index++, query.start_after->id);
      }

      if (query.limit.has_value()) {
        statement.bind(index++, static_cast<int64_t>(query.limit.value()));
      }

      while (statement.executeStep()) {
        rows.push_back(DocumentRow{statement.getColumn(0).getString(),
                                   static_cast<int64_t>(statement.getColumn(1).getInt64()),
                                   {}});
      }
    });

    if (query.include_docs) {
      for (auto &row: rows) {
        row.document = load_document(row.id);
      }
    }

    co_return rows;
  }

  boost::asio::awaitable<uint64_t> count_by_version(int64_t endVersion) override {
    std::scoped_lock lock(mMutex);
    std::string const sql = "SELECT COUNT(*) FROM documents WHERE version < ?";
    uint64_t count = 0;

    guarded(sql, [&]() {
      SQLite::Statement statement(mDb, sql);

      statement.bind(1, static_cast<int64_t>(endVersion));

      if (statement.executeStep()) {
        count = static_cast<uint64_t>(statement.getColumn(0).getInt64());
      }
    });

    co_return count;
  }

  boost::asio::awaitable<void> upsert(Document document) override {
    std::scoped_lock lock(mMutex);

    guarded("upsert", [&]() {
      SQLite::Transaction transaction(mDb);

      SQLite::Statement replace(
        mDb, "INSERT OR REPLACE INTO documents (id, version) VALUES (?, ?);");

      replace.bind(1, document.get_id());
      replace.bind(2, static_cast<int64_t>(document.get_version(mVersionField)));
      replace.exec();

      SQLite::Statement clear(mDb, "DELETE FROM document_fields WHERE document_id = ?;");

      clear.bind(1, document.get_id());
      clear.exec();

      SQLite::Statement insert(
        mDb, "INSERT INTO document_fields (document_id, name, kind, value) "
        "VALUES (?, ?, ?, ?);");

      for (auto const &[name, value]: document.get_fields()) {
        insert.bind(1, document.get_id());
        insert.bind(2, name);
        insert.bind(3, static_cast<int>(value.get_kind()));

        value.get_value(overloaded{
          [&](std::nullptr_t) { insert.bind(4); },
          [&](bool arg) { insert.bind(4, static_cast<int64_t>(arg ? 1 : 0)); },
          [&](int64_t arg) { insert.bind(4, arg); },
          [&](double arg) { insert.bind(4, arg); },
          [&](std::string const &arg) { insert.bind(4, arg); }
        });

        insert.exec();
        insert.reset();
        insert.clearBindings();
      }

      transaction.commit();
    });

    co_return;
  }

  /*
    Loads a single document, std::nullopt when the document does not exist
    or holds a cell that cannot be decoded.
  */
  std::optional<Document> find(std::string const &id) {
    std::scoped_lock lock(mMutex);

    return load_document(id);
  }

private:
  SQLite::Database mDb;
  std::string mVersionField;
  std::mutex mMutex;

  void execute(std::string const &sql) {
    guarded(sql, [&]() { mDb.exec(sql); });
  }

  void guarded(std::string const &context, std::function<void()> callback) {
    try {
      callback();
    } catch (std::exception &e) {
      throw std::runtime_error(fmt::format("{}: {}", e.what(), context));
    }
  }

  std::optional<Document> load_document(std::string const &id) {
    std::optional<Document> document;
    bool malformed = false;
    std::string const sql =
      "SELECT d.id, f.name, f.kind, f.value FROM documents d "
      "LEFT JOIN document_fields f ON f.document_id = d.id WHERE d.id = ?;";

    guarded(sql, [&]() {
      SQLite::Statement statement(mDb, sql);

      statement.bind(1, id);

      while (statement.executeStep()) {
        if (!document.has_value()) {
          document = Document{statement.getColumn(0).getString()};
        }

        if (statement.getColumn(1).isNull()) {
          continue;
        }

        std::string name = statement.getColumn(1).getString();

        switch (static_cast<DataKind>(statement.getColumn(2).getInt())) {
          case DataKind::Null:
            (*document)[name] = nullptr;
            break;
          case DataKind::Bool:
            (*document)[name] = statement.getColumn(3).getInt64() != 0;
            break;
          case DataKind::Int:
            (*document)[name] = static_cast<int64_t>(statement.getColumn(3).getInt64());
            break;
          case DataKind::Decimal:
            (*document)[name] = statement.getColumn(3).getDouble();
            break;
          case DataKind::Text:
            (*document)[name] = statement.getColumn(3).getString();
            break;
          default:
            malformed = true;
            break;
        }
      }
    });

    if (malformed) {
      return {};
    }

    return document;
  }
};
