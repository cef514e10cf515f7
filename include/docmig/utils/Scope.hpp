#pragma once

#include <cstddef>
#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/thread/thread.hpp>

namespace docmig {
  /*
    Pool of threads running coroutines for a blocking caller. Every task
    given to run() gets a strand of its own, so the task and the coroutines
    it spawns never run concurrently while separate tasks do.

    run() must not be called from one of the pool threads.
  */
  struct Scope {
    explicit Scope(std::size_t threads = 1)
      : mWorkGuard{boost::asio::make_work_guard(mIoContext)} {
      if (threads == 0) {
        throw std::runtime_error("scope requires at least one thread");
      }

      while (mThreads.size() < threads) {
        mThreads.create_thread([this]() { mIoContext.run(); });
      }
    }

    Scope(Scope const &) = delete;
    Scope &operator=(Scope const &) = delete;

    ~Scope() {
      stop();
    }

    boost::asio::any_io_executor get_executor() {
      return mIoContext.get_executor();
    }

    template<typename T>
    T run(boost::asio::awaitable<T> task) {
      std::promise<T> promise;
      auto result = promise.get_future();

      ensure_running();

      boost::asio::co_spawn(boost::asio::make_strand(mIoContext), std::move(task),
                            [&promise](std::exception_ptr e, T value) {
                              if (e) {
                                promise.set_exception(e);
                              } else {
                                promise.set_value(std::move(value));
                              }
                            });

      return result.get();
    }

    void run(boost::asio::awaitable<void> task) {
      std::promise<void> promise;
      auto result = promise.get_future();

      ensure_running();

      boost::asio::co_spawn(boost::asio::make_strand(mIoContext), std::move(task),
                            [&promise](std::exception_ptr e) {
                              if (e) {
                                promise.set_exception(e);
                              } else {
                                promise.set_value();
                              }
                            });

      result.get();
    }

    bool is_stopped() const { return mStopped; }

    /*
      Drops the pending work and joins the pool. Tasks still running are
      abandoned.
    */
    void stop() {
      if (mStopped) {
        return;
      }

      mStopped = true;

      mWorkGuard.reset();
      mIoContext.stop();
      mThreads.join_all();
    }

  private:
    boost::asio::io_context mIoContext;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> mWorkGuard;
    boost::thread_group mThreads;
    bool mStopped{false};

    void ensure_running() const {
      if (mStopped) {
        throw std::runtime_error("scope is stopped");
      }
    }
  };
}
