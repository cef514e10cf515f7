#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using Logger = std::shared_ptr<spdlog::logger>;

/*
  Returns the logger registered under tag, creating a colored stdout logger
  the first time a tag is requested.
*/
inline Logger create_logger(std::string const &tag) {
  static std::mutex mutex;
  std::lock_guard<std::mutex> lock(mutex);

  auto logger = spdlog::get(tag);

  if (logger == nullptr) {
    logger = spdlog::stdout_color_mt(tag);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S][%l][%n] %v");
  }

  return logger;
}
