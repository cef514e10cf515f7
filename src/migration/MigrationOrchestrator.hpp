#pragma once

#include "config/MigrationConfig.hpp"
#include "migration/BatchProcessor.hpp"
#include "migration/DocumentMigrator.hpp"
#include "migration/MigrationError.hpp"
#include "migration/ProgressTracker.hpp"
#include "migration/StepRegistry.hpp"
#include "migration/StepSource.hpp"
#include "store/DocumentStore.hpp"
#include "utils/Format.hpp"
#include "utils/Logger.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

struct MigrationSummary {
  int64_t target{0};
  uint64_t total{0};
  uint64_t done{0};
  uint64_t written{0};
  uint64_t failed{0};
  std::chrono::milliseconds elapsed{0};
};

/*
  Entry point of a migration run: loads the steps once, resolves the target
  version, counts the candidates and drives a BatchProcessor while a
  ProgressTracker reports. Errors are returned, never thrown.

  The callback overloads run on a strand of the given executor and require
  the orchestrator to outlive the operation.
*/
struct MigrationOrchestrator {
  enum class LoadState { Unloaded, Loading, Loaded };

  using Callback = std::function<void(std::optional<MigrationError>)>;
  using ProgressObserver = std::function<void(ProgressSnapshot const &)>;

  MigrationOrchestrator(boost::asio::any_io_executor executor,
                        std::shared_ptr<DocumentStore> store,
                        std::shared_ptr<StepSource> source,
                        MigrationConfig config = {}, Logger logger = {})
    : mExecutor{boost::asio::make_strand(executor)},
      mLoadSignal{mExecutor, boost::asio::steady_timer::time_point::max()},
      mStore{std::move(store)}, mSource{std::move(source)},
      mConfig{std::move(config)}, mLogger{std::move(logger)} {
    mConfig.validate();

    if (mStore == nullptr or mSource == nullptr) {
      throw std::runtime_error("migrations require a document store and a step source");
    }

    if (mLogger == nullptr) {
      mLogger = create_logger(mConfig.log_tag);
    }
  }

  boost::asio::awaitable<std::expected<void, MigrationError> > load_steps() {
    while (mLoadState == LoadState::Loading) {
      boost::system::error_code ec;

      co_await mLoadSignal.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (mLoadState == LoadState::Loaded) {
      co_return std::expected<void, MigrationError>{};
    }

    mLoadState = LoadState::Loading;
    mLoadSignal.expires_at(boost::asio::steady_timer::time_point::max());

    std::optional<MigrationError> error;

    try {
      auto steps = co_await mSource->load();

      mRegistry.clear();
      mRegistry.add_steps(std::move(steps));
    } catch (...) {
      error = MigrationError::step_load(MigrationError::describe(std::current_exception()));
    }

    if (error.has_value()) {
      mRegistry.clear();
      mLoadState = LoadState::Unloaded;
      mLoadSignal.cancel();

      mLogger->error("{}", error->what());

      co_return std::unexpected{std::move(*error)};
    }

    mLoadState = LoadState::Loaded;
    mLoadSignal.cancel();

    mLogger->debug("{} migrations loaded, last is v{}", mRegistry.size(),
                   mRegistry.get_last().value_or(0));

    co_return std::expected<void, MigrationError>{};
  }

  void load_steps(Callback onDone) {
    boost::asio::co_spawn(
      mExecutor, load_steps(),
      [onDone = std::move(onDone)](std::exception_ptr e,
                                   std::expected<void, MigrationError> result) {
        if (e) {
          onDone(MigrationError::aborted(MigrationError::describe(e)));

          return;
        }

        if (!result.has_value()) {
          onDone(result.error());

          return;
        }

        onDone({});
      });
  }

  /*
    Migrates every document below target, or below the highest known step
    when no target is given.
  */
  boost::asio::awaitable<std::expected<MigrationSummary, MigrationError> >
    run_migrations(std::optional<int64_t> target = {}) {
    if (auto loaded = co_await load_steps(); !loaded.has_value()) {
      co_return std::unexpected{loaded.error()};
    }

    auto last = mRegistry.get_last();

    if (!last.has_value()) {
      co_return std::unexpected{MigrationError::no_steps_found()};
    }

    MigrationSummary summary;
    std::optional<MigrationError> error;
    auto started = std::chrono::steady_clock::now();

    summary.target = target.value_or(last.value());

    mLogger->info("Running migrations up to v{}", summary.target);

    try {
      summary.total = co_await mStore->count_by_version(summary.target);
    } catch (std::exception &e) {
      error = MigrationError::store_query(e.what());
    }

    if (error.has_value()) {
      mLogger->error("{}", error->what());

      co_return std::unexpected{std::move(*error)};
    }

    auto progress = std::make_shared<ProgressTracker>(mExecutor, mLogger,
                                                      mConfig.progress_interval);

    for (auto const &observer: mObservers) {
      progress->get_state().observe(observer);
    }

    mProgress = progress;

    DocumentMigrator migrator{mRegistry, mConfig.version_field, mLogger};
    BatchProcessor batch{*mStore, migrator, *progress, mLogger};

    progress->start(summary.total);

    std::expected<void, MigrationError> result;

    try {
      result = co_await batch.run(summary.target, mConfig.page_size);
    } catch (...) {
      progress->stop();

      throw;
    }

    progress->stop();

    if (!result.has_value()) {
      mLogger->error("{}", result.error().what());

      co_return std::unexpected{result.error()};
    }

    auto snapshot = progress->get_snapshot();

    summary.done = snapshot.done;
    summary.written = snapshot.written;
    summary.failed = snapshot.failed;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

    mLogger->info(
      "Migrations completed in {}, {} documents processed, {} documents modified, {} failed.",
      format_elapsed(summary.elapsed), summary.done, summary.written, summary.failed);

    co_return summary;
  }

  void run_migrations(std::optional<int64_t> target, Callback onDone) {
    boost::asio::co_spawn(
      mExecutor, run_migrations(target),
      [onDone = std::move(onDone)](
      std::exception_ptr e, std::expected<MigrationSummary, MigrationError> result) {
        if (e) {
          onDone(MigrationError::aborted(MigrationError::describe(e)));

          return;
        }

        if (!result.has_value()) {
          onDone(result.error());

          return;
        }

        onDone({});
      });
  }

  /*
    Registers an observer called with every periodic progress report of the
    runs started afterwards.
  */
  void observe_progress(ProgressObserver observer) {
    mObservers.push_back(std::move(observer));
  }

  ProgressSnapshot get_progress() const {
    if (mProgress == nullptr) {
      return {};
    }

    return mProgress->get_snapshot();
  }

  bool is_reporting() const {
    return mProgress != nullptr and mProgress->is_running();
  }

  LoadState get_load_state() const { return mLoadState; }

  StepRegistry const &get_registry() const { return mRegistry; }

  MigrationConfig const &get_config() const { return mConfig; }

private:
  boost::asio::any_io_executor mExecutor;
  boost::asio::steady_timer mLoadSignal;
  std::shared_ptr<DocumentStore> mStore;
  std::shared_ptr<StepSource> mSource;
  MigrationConfig mConfig;
  Logger mLogger;
  StepRegistry mRegistry;
  LoadState mLoadState{LoadState::Unloaded};
  std::shared_ptr<ProgressTracker> mProgress;
  std::vector<ProgressObserver> mObservers;
};
