/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <map>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
  void setGlobalPattern(spdlog::logger &logger) {
    logger.set_pattern("[%Y-%m-%d %H:%M:%S][%l][%n] %v");
  }

  std::shared_ptr<spdlog::logger> createColorLogger(const std::string &tag) {
    auto logger = spdlog::stdout_color_mt(tag);
    setGlobalPattern(*logger);
    return logger;
  }
}  // namespace

namespace xr::common {
  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = createColorLogger(tag);
    }
    return logger;
  }

  bool setLogLevel(char level) {
    static const std::map<char, spdlog::level::level_enum> kLevels{
        {'t', spdlog::level::trace},
        {'d', spdlog::level::debug},
        {'i', spdlog::level::info},
        {'w', spdlog::level::warn},
        {'e', spdlog::level::err},
        {'c', spdlog::level::critical},
        {'o', spdlog::level::off},
    };
    const auto it = kLevels.find(level);
    if (it == kLevels.end()) {
      return false;
    }
    spdlog::set_level(it->second);
    return true;
  }
}  // namespace xr::common
