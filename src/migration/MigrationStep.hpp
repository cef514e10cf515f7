#pragma once

#include "document/Document.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>

/*
  A migration step stamps its id on every document it is applied to. The
  transform may rewrite the document (returning the replacement) or leave
  it as is (returning std::nullopt); a step without transform only stamps.
*/
struct MigrationStep {
  using Transform =
    std::function<boost::asio::awaitable<std::optional<Document> >(Document const &)>;
  using SyncTransform = std::function<std::optional<Document>(Document const &)>;

  explicit MigrationStep(int64_t id) : mId{id} {
  }

  MigrationStep(int64_t id, Transform transform)
    : mTransform{std::move(transform)}, mId{id} {
  }

  MigrationStep(int64_t id, SyncTransform transform) : mId{id} {
    if (transform) {
      mTransform = [transform = std::move(transform)](Document const &document)
        -> boost::asio::awaitable<std::optional<Document> > {
        co_return transform(document);
      };
    }
  }

  virtual ~MigrationStep() = default;

  int64_t get_id() const {
    return mId;
  }

  bool has_transform() const {
    return static_cast<bool>(mTransform);
  }

  boost::asio::awaitable<std::optional<Document> > apply(Document const &document) const {
    if (!mTransform) {
      co_return std::nullopt;
    }

    co_return co_await mTransform(document);
  }

private:
  Transform mTransform;
  int64_t mId;
};
