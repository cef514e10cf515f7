#pragma once

#include "config/MigrationConfig.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <sstream>
#include <string>

#include <boost/program_options.hpp>

#include <spdlog/common.h>

#include <fmt/format.h>

struct ToolOptions {
  std::string database;
  std::optional<int64_t> target;
  spdlog::level::level_enum log_level{spdlog::level::info};
  MigrationConfig migration;
  bool list{false};
  bool help{false};
};

inline boost::program_options::options_description tool_options_description() {
  namespace po = boost::program_options;

  po::options_description description{"docmig-status options"};

  // clang-format off
  description.add_options()
  ("help,h", "Print this message")
  ("database,d", po::value<std::string>(), "SQLite document store to inspect")
  ("target,t", po::value<int64_t>(), "Version the documents should reach")
  ("version-field", po::value<std::string>()->default_value(DefaultVersionField), "Name of the version marker field")
  ("page-size", po::value<std::size_t>()->default_value(512), "Number of documents fetched per page")
  ("list", "List the first page of pending documents")
  ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error, critical or off");
  // clang-format on

  return description;
}

inline std::string tool_usage() {
  std::ostringstream o;

  o << tool_options_description();

  return o.str();
}

/*
  Parses the command line of the inspection tool, returning a message
  describing the first invalid option on failure.
*/
inline std::expected<ToolOptions, std::string> parse_command_line(int argc,
                                                                  char const *const argv[]) {
  namespace po = boost::program_options;

  ToolOptions options;
  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv).options(tool_options_description()).run(), vm);
    po::notify(vm);
  } catch (po::error &e) {
    return std::unexpected{std::string{e.what()}};
  }

  if (vm.count("help") > 0) {
    options.help = true;

    return options;
  }

  if (vm.count("database") == 0) {
    return std::unexpected{std::string{"the option '--database' is required"}};
  }

  if (vm.count("target") == 0) {
    return std::unexpected{std::string{"the option '--target' is required"}};
  }

  options.database = vm["database"].as<std::string>();
  options.target = vm["target"].as<int64_t>();
  options.list = vm.count("list") > 0;
  options.migration.version_field = vm["version-field"].as<std::string>();
  options.migration.page_size = vm["page-size"].as<std::size_t>();

  auto level = vm["log-level"].as<std::string>();

  options.log_level = spdlog::level::from_str(level);

  if (options.log_level == spdlog::level::off and level != "off") {
    return std::unexpected{fmt::format("unknown log level '{}'", level)};
  }

  try {
    options.migration.validate();
  } catch (std::runtime_error &e) {
    return std::unexpected{std::string{e.what()}};
  }

  return options;
}
