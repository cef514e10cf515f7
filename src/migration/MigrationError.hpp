#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

enum class MigrationErrorKind { NoStepsFound, StepLoad, StoreQuery, Persistence, Aborted };

inline std::string_view to_string(MigrationErrorKind kind) {
  switch (kind) {
    case MigrationErrorKind::NoStepsFound:
      return "NoStepsFound";
    case MigrationErrorKind::StepLoad:
      return "StepLoad";
    case MigrationErrorKind::StoreQuery:
      return "StoreQuery";
    case MigrationErrorKind::Persistence:
      return "Persistence";
    case MigrationErrorKind::Aborted:
      return "Aborted";
  }

  return "Unknown";
}

struct MigrationError : public std::runtime_error {
  MigrationError(MigrationErrorKind kind, std::string const &message)
    : std::runtime_error{message}, mKind{kind} {
  }

  MigrationErrorKind get_kind() const { return mKind; }

  static MigrationError no_steps_found() {
    return {MigrationErrorKind::NoStepsFound, "No migrations found"};
  }

  static MigrationError step_load(std::string_view reason) {
    return {MigrationErrorKind::StepLoad,
            fmt::format("Unable to load migrations: {}", reason)};
  }

  static MigrationError store_query(std::string_view reason) {
    return {MigrationErrorKind::StoreQuery,
            fmt::format("Unable to retrieve data: {}", reason)};
  }

  static MigrationError persistence(std::string_view id, std::string_view reason) {
    return {MigrationErrorKind::Persistence,
            fmt::format("Unable to persist document '{}': {}", id, reason)};
  }

  static MigrationError aborted(std::string_view reason) {
    return {MigrationErrorKind::Aborted, fmt::format("Migration aborted: {}", reason)};
  }

  /*
    Message of an exception caught as a std::exception_ptr, whatever its type.
  */
  static std::string describe(std::exception_ptr e) {
    try {
      std::rethrow_exception(e);
    } catch (std::exception &error) {
      return error.what();
    } catch (...) {
      return "unknown exception";
    }
  }

private:
  MigrationErrorKind mKind;
};
