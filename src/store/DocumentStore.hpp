#pragma once

#include "document/Document.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

/*
  Position of a row in the version view: rows are ordered by version, then
  by document id.
*/
struct RowKey {
  int64_t version{0};
  std::string id;

  bool operator<(RowKey const &other) const {
    return std::tie(version, id) < std::tie(other.version, other.id);
  }

  bool operator==(RowKey const &other) const {
    return version == other.version and id == other.id;
  }
};

struct DocumentRow {
  std::string id;
  int64_t version{0};
  std::optional<Document> document;

  RowKey get_key() const { return {version, id}; }
};

struct VersionQuery {
  int64_t end_version{0};
  std::optional<std::size_t> limit;
  std::optional<RowKey> start_after;
  bool include_docs{true};
};

/*
  Versioned document store. Every operation reports failures by throwing
  std::runtime_error.
*/
struct DocumentStore {
  virtual ~DocumentStore() = default;

  /*
    Rows whose version is strictly lower than end_version, in row key order,
    starting after start_after when set, and at most limit of them.
  */
  virtual boost::asio::awaitable<std::vector<DocumentRow> >
    query_by_version(VersionQuery query) = 0;

  virtual boost::asio::awaitable<uint64_t> count_by_version(int64_t endVersion) {
    VersionQuery query{.end_version = endVersion, .include_docs = false};
    auto rows = co_await query_by_version(query);

    co_return static_cast<uint64_t>(rows.size());
  }

  /*
    Creates or overwrites the document with the same id.
  */
  virtual boost::asio::awaitable<void> upsert(Document document) = 0;
};
