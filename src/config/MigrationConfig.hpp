#pragma once

#include "document/Document.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

struct MigrationConfig {
  std::string version_field = DefaultVersionField;
  std::size_t page_size = 512;
  std::chrono::milliseconds progress_interval{5000};
  std::string log_tag = "Migrations";

  void validate() const {
    if (version_field.empty()) {
      throw std::runtime_error("version field must not be empty");
    }

    if (page_size == 0) {
      throw std::runtime_error("page size must be greater than zero");
    }

    if (progress_interval.count() <= 0) {
      throw std::runtime_error(fmt::format(
        "progress interval must be positive, got {}ms", progress_interval.count()));
    }
  }
};
