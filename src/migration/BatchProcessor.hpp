#pragma once

#include "migration/DocumentMigrator.hpp"
#include "migration/MigrationError.hpp"
#include "migration/ProgressTracker.hpp"
#include "store/DocumentStore.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

/*
  Pages through the documents below the target version and migrates every
  page with at most MaxInFlight documents in flight. A page is fully drained
  before the next one is requested; the next page starts after the last row
  of the previous one, so documents that did not move are not fetched again.
  Documents moved to a version still below the target are skipped when a
  later page returns them.

  Must run on a single threaded context or on a strand.
*/
struct BatchProcessor {
  static constexpr std::size_t MaxInFlight = 32;

  using Callback = std::function<void(std::optional<MigrationError>)>;

  BatchProcessor(DocumentStore &store, DocumentMigrator const &migrator,
                 ProgressTracker &progress, Logger logger)
    : mStore{store}, mMigrator{migrator}, mProgress{progress},
      mLogger{std::move(logger)} {
  }

  boost::asio::awaitable<std::expected<void, MigrationError> >
    run(int64_t target, std::size_t pageSize) {
    VersionQuery query{target, pageSize, {}, true};
    std::set<std::string> ahead;

    for (;;) {
      std::vector<DocumentRow> rows;
      std::optional<MigrationError> error;

      try {
        rows = co_await mStore.query_by_version(query);
      } catch (std::exception &e) {
        error = MigrationError::store_query(e.what());
      }

      if (error.has_value()) {
        co_return std::unexpected{std::move(*error)};
      }

      if (rows.empty()) {
        break;
      }

      query.start_after = rows.back().get_key();

      // rows rewritten by an earlier page that are still below the target
      std::erase_if(rows, [&](DocumentRow const &row) {
        return ahead.erase(row.id) > 0;
      });

      mLogger->debug("Migrating page of {} documents below v{}", rows.size(), target);

      co_await process_page(rows, target, ahead);
    }

    co_return std::expected<void, MigrationError>{};
  }

  void run(boost::asio::any_io_executor executor, int64_t target,
           std::size_t pageSize, Callback onComplete) {
    boost::asio::co_spawn(
      executor, run(target, pageSize),
      [onComplete = std::move(onComplete)](
      std::exception_ptr e, std::expected<void, MigrationError> result) {
        if (e) {
          onComplete(MigrationError::aborted(MigrationError::describe(e)));

          return;
        }

        if (!result.has_value()) {
          onComplete(result.error());

          return;
        }

        onComplete({});
      });
  }

private:
  DocumentStore &mStore;
  DocumentMigrator const &mMigrator;
  ProgressTracker &mProgress;
  Logger mLogger;

  boost::asio::awaitable<void> process_page(std::vector<DocumentRow> &rows,
                                            int64_t target,
                                            std::set<std::string> &ahead) {
    auto executor = co_await boost::asio::this_coro::executor;
    std::size_t next = 0;
    std::size_t running = std::min(MaxInFlight, rows.size());
    boost::asio::steady_timer drained{executor,
                                      boost::asio::steady_timer::time_point::max()};

    if (running == 0) {
      co_return;
    }

    for (std::size_t i = 0, workers = running; i < workers; i++) {
      boost::asio::co_spawn(
        executor,
        [&]() -> boost::asio::awaitable<void> {
          while (next < rows.size()) {
            co_await process_row(rows[next++], target, ahead);
          }

          if (--running == 0) {
            drained.expires_at(boost::asio::steady_timer::time_point::min());
          }
        },
        boost::asio::detached);
    }

    while (running > 0) {
      boost::system::error_code ec;

      co_await drained.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
  }

  boost::asio::awaitable<void> process_row(DocumentRow &row, int64_t target,
                                           std::set<std::string> &ahead) {
    if (!row.document.has_value()) {
      mLogger->warn("Skipping malformed row '{}' at v{}", row.id, row.version);

      mProgress.tick(false);

      co_return;
    }

    std::optional<std::string> failure;

    try {
      auto result = co_await mMigrator.migrate(std::move(*row.document), target);

      if (result.modified or result.to_version != result.from_version) {
        co_await mStore.upsert(std::move(result.document));

        if (result.to_version != result.from_version and result.to_version < target) {
          ahead.insert(row.id);
        }
      }

      mProgress.tick(result.modified);
    } catch (...) {
      failure = MigrationError::describe(std::current_exception());
    }

    if (failure.has_value()) {
      mLogger->error("{}", MigrationError::persistence(row.id, *failure).what());

      mProgress.fail();
    }
  }
};
