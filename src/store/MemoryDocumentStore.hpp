#pragma once

#include "store/DocumentStore.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct MemoryDocumentStore : public DocumentStore {
  explicit MemoryDocumentStore(std::string versionField = DefaultVersionField)
    : mVersionField{std::move(versionField)} {
  }

  boost::asio::awaitable<std::vector<DocumentRow> >
    query_by_version(VersionQuery query) override {
    std::vector<DocumentRow> rows;

    {
      std::scoped_lock lock(mMutex);

      for (auto const &[id, document]: mDocuments) {
        DocumentRow row{id, document.get_version(mVersionField), {}};

        if (row.version >= query.end_version) {
          continue;
        }

        if (query.start_after.has_value() and
            !(query.start_after.value() < row.get_key())) {
          continue;
        }

        if (query.include_docs) {
          row.document = document;
        }

        rows.push_back(std::move(row));
      }
    }

    std::sort(rows.begin(), rows.end(), [](auto const &a, auto const &b) {
      return a.get_key() < b.get_key();
    });

    if (query.limit.has_value() and rows.size() > query.limit.value()) {
      rows.resize(query.limit.value());
    }

    co_return rows;
  }

  boost::asio::awaitable<void> upsert(Document document) override {
    std::scoped_lock lock(mMutex);

    std::string id = document.get_id();

    mDocuments.insert_or_assign(std::move(id), std::move(document));

    co_return;
  }

  std::optional<Document> find(std::string const &id) const {
    std::scoped_lock lock(mMutex);

    if (auto it = mDocuments.find(id); it != mDocuments.end()) {
      return {it->second};
    }

    return {};
  }

  std::size_t size() const {
    std::scoped_lock lock(mMutex);

    return mDocuments.size();
  }

  std::string const &get_version_field() const { return mVersionField; }

private:
  std::map<std::string, Document> mDocuments;
  std::string mVersionField;
  mutable std::mutex mMutex;
};
