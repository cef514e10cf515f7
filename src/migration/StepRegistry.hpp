#pragma once

#include "migration/MigrationStep.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

/*
  Ordered set of migration steps. Steps are kept sorted by id and indexed by
  the version they apply to: the first step applies to version 0 and every
  other step applies to the id of the step preceding it.
*/
struct StepRegistry {
  StepRegistry &add_step(MigrationStep step) {
    if (step.get_id() <= 0) {
      throw std::runtime_error(
        fmt::format("migration id '{}' must be positive", step.get_id()));
    }

    if (std::find_if(mSteps.begin(), mSteps.end(),
                     [id = step.get_id()](auto const &item) {
                       return item.get_id() == id;
                     }) != mSteps.end()) {
      throw std::runtime_error(
        fmt::format("migration id '{}' already exists", step.get_id()));
    }

    mSteps.push_back(std::move(step));

    std::sort(
      mSteps.begin(), mSteps.end(),
      [](auto const &a, auto const &b) { return a.get_id() < b.get_id(); });

    reindex();

    return *this;
  }

  StepRegistry &add_steps(std::vector<MigrationStep> steps) {
    for (auto &step: steps) {
      add_step(std::move(step));
    }

    return *this;
  }

  void clear() {
    mSteps.clear();
    mIndex.clear();
  }

  std::optional<int64_t> get_last() const {
    if (mSteps.empty()) {
      return {};
    }

    return {mSteps.back().get_id()};
  }

  MigrationStep const *find_from(int64_t version) const {
    if (auto it = mIndex.find(version); it != mIndex.end()) {
      return &mSteps[it->second];
    }

    return nullptr;
  }

  std::vector<MigrationStep> const &get_steps() const { return mSteps; }

  std::size_t size() const { return mSteps.size(); }

  bool empty() const { return mSteps.empty(); }

private:
  std::vector<MigrationStep> mSteps;
  std::map<int64_t, std::size_t> mIndex;

  void reindex() {
    int64_t from = 0;

    mIndex.clear();

    for (std::size_t i = 0; i < mSteps.size(); i++) {
      mIndex[from] = i;
      from = mSteps[i].get_id();
    }
  }
};
