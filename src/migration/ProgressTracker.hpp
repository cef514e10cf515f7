#pragma once

#include "docmig/utils/State.hpp"
#include "utils/Format.hpp"
#include "utils/Logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

struct ProgressSnapshot {
  uint64_t done{0};
  uint64_t written{0};
  uint64_t failed{0};
  uint64_t total{0};
};

/*
  Counters of a migration run plus a periodic report. The report is a side
  effect only and never throttles the run. The timer is cancelled by stop()
  or, at the latest, by the destructor.
*/
struct ProgressTracker {
  inline static std::chrono::milliseconds const DefaultInterval{5000};

  ProgressTracker(boost::asio::any_io_executor executor, Logger logger,
                  std::chrono::milliseconds interval = DefaultInterval)
    : mTimer{std::move(executor)}, mLogger{std::move(logger)},
      mInterval{interval} {
  }

  ProgressTracker(ProgressTracker const &) = delete;
  ProgressTracker &operator=(ProgressTracker const &) = delete;

  ~ProgressTracker() {
    stop();
  }

  void start(uint64_t total) {
    mDone.store(0);
    mWritten.store(0);
    mFailed.store(0);
    mTotal.store(total);
    mState.reset();

    stop();

    mRunning = std::make_shared<std::atomic<bool> >(true);

    schedule();
  }

  void stop() {
    if (mRunning != nullptr and mRunning->exchange(false)) {
      mTimer.cancel();
    }
  }

  bool is_running() const { return mRunning != nullptr and mRunning->load(); }

  void tick(bool written) {
    mDone.fetch_add(1);

    if (written) {
      mWritten.fetch_add(1);
    }
  }

  void fail() {
    mFailed.fetch_add(1);
    mDone.fetch_add(1);
  }

  ProgressSnapshot get_snapshot() const {
    return {mDone.load(), mWritten.load(), mFailed.load(), mTotal.load()};
  }

  docmig::State<ProgressSnapshot> &get_state() { return mState; }

  void report() {
    auto snapshot = get_snapshot();

    mLogger->info("Migration: {}", format_ratio(snapshot.done, snapshot.total));

    mState.notify(snapshot);
  }

private:
  boost::asio::steady_timer mTimer;
  Logger mLogger;
  std::chrono::milliseconds mInterval;
  docmig::MutableState<ProgressSnapshot> mState;
  std::atomic<uint64_t> mDone{0};
  std::atomic<uint64_t> mWritten{0};
  std::atomic<uint64_t> mFailed{0};
  std::atomic<uint64_t> mTotal{0};
  std::shared_ptr<std::atomic<bool> > mRunning;

  void schedule() {
    mTimer.expires_after(mInterval);
    mTimer.async_wait([this, running = mRunning](boost::system::error_code const &ec) {
      if (ec == boost::asio::error::operation_aborted or !running->load()) {
        return;
      }

      report();
      schedule();
    });
  }
};
