#include "config/Options.hpp"
#include "store/SqliteDocumentStore.hpp"
#include "utils/Logger.hpp"

#include "docmig/utils/Scope.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

int main(int argc, char *argv[]) {
  auto options = parse_command_line(argc, argv);

  if (!options.has_value()) {
    std::cerr << options.error() << "\n\n" << tool_usage();

    return 1;
  }

  if (options->help) {
    std::cout << tool_usage();

    return 0;
  }

  spdlog::set_level(options->log_level);

  auto logger = create_logger(options->migration.log_tag);

  try {
    auto store = std::make_shared<SqliteDocumentStore>(
      options->database, options->migration.version_field);
    int64_t target = options->target.value();
    docmig::Scope scope{1};

    uint64_t count = scope.run(store->count_by_version(target));

    logger->info("{} documents below v{} in '{}'", count, target, options->database);

    if (options->list) {
      VersionQuery query{target, options->migration.page_size, {}, false};

      for (auto const &row: scope.run(store->query_by_version(query))) {
        std::cout << row.id << " v" << row.version << "\n";
      }
    }
  } catch (std::exception &e) {
    logger->error("{}", e.what());

    return 1;
  }

  return 0;
}
