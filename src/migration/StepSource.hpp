#pragma once

#include "migration/MigrationStep.hpp"

#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

/*
  Supplies the migration steps, in any order.
*/
struct StepSource {
  virtual ~StepSource() = default;

  virtual boost::asio::awaitable<std::vector<MigrationStep> > load() = 0;
};

struct StaticStepSource : public StepSource {
  StaticStepSource() = default;

  explicit StaticStepSource(std::vector<MigrationStep> steps)
    : mSteps{std::move(steps)} {
  }

  StaticStepSource &add_step(MigrationStep step) {
    mSteps.push_back(std::move(step));

    return *this;
  }

  boost::asio::awaitable<std::vector<MigrationStep> > load() override {
    co_return mSteps;
  }

private:
  std::vector<MigrationStep> mSteps;
};
