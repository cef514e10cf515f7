#pragma once

#include "document/Document.hpp"
#include "migration/StepRegistry.hpp"
#include "utils/Logger.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

struct MigrationResult {
  Document document;
  int64_t from_version{0};
  int64_t to_version{0};
  bool modified{false};
  bool stalled{false};
};

/*
  Applies, one after the other, every step whose source version is the
  current version of the document until the target is reached or no step
  applies anymore. Exceptions raised by a transform are not handled here.
*/
struct DocumentMigrator {
  DocumentMigrator(StepRegistry const &registry, std::string versionField,
                   Logger logger)
    : mRegistry{registry}, mVersionField{std::move(versionField)},
      mLogger{std::move(logger)} {
  }

  std::string const &get_version_field() const { return mVersionField; }

  boost::asio::awaitable<MigrationResult> migrate(Document document,
                                                  int64_t target) const {
    MigrationResult result;

    result.from_version = document.get_version(mVersionField);

    int64_t version = result.from_version;

    while (version < target) {
      MigrationStep const *step = mRegistry.find_from(version);

      if (step == nullptr or step->get_id() <= version) {
        mLogger->warn("Document '{}' stuck at v{}, no migration to reach v{}",
                      document.get_id(), version, target);

        result.stalled = true;

        break;
      }

      if (auto replacement = co_await step->apply(document);
        replacement.has_value()) {
        document = std::move(*replacement);
        result.modified = true;
      }

      document.set_version(step->get_id(), mVersionField);

      version = step->get_id();
    }

    result.document = std::move(document);
    result.to_version = version;

    co_return result;
  }

private:
  StepRegistry const &mRegistry;
  std::string mVersionField;
  Logger mLogger;
};
