/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace xr::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Set level of all registered and future loggers
   * @param level - one of "tdiweco" (trace, debug, info, warn, error,
   * critical, off)
   * @return false if level char is unknown
   */
  bool setLogLevel(char level);
}  // namespace xr::common
