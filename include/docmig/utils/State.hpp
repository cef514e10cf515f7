#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace docmig {
  template<typename T>
  struct MutableState;

  /*
    Read side of an observable value. Observers are called, under the state
    lock, every time a new value is published.
  */
  template<typename T>
  struct State {
    explicit State(MutableState<T> &state) : mState{state} {
    }

    virtual ~State() = default;

    void observe(std::function<void(T const &)> callback) {
      std::scoped_lock lock(mState.mMutex);

      mState.mCallbacks.push_back(std::move(callback));
    }

    std::optional<T> get() const {
      std::scoped_lock lock(mState.mMutex);

      return mState.mData;
    }

  private:
    MutableState<T> &mState;
  };

  template<typename T>
  struct MutableState : public State<T> {
    friend struct State<T>;

    MutableState() : State<T>(*this) {
    }

    MutableState(MutableState const &) = delete;
    MutableState &operator=(MutableState const &) = delete;

    void notify(T const &data) {
      std::scoped_lock lock(mMutex);

      mData = data;

      for (auto const &callback: mCallbacks) {
        callback(data);
      }
    }

    void reset() {
      std::scoped_lock lock(mMutex);

      mData.reset();
    }

  private:
    std::vector<std::function<void(T const &)> > mCallbacks;
    std::optional<T> mData;
    mutable std::mutex mMutex;
  };
}
