/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vefee::common {
  Logger createLogger(const std::string &tag) {
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = spdlog::stdout_color_mt(tag);
    }
    return logger;
  }
}  // namespace vefee::common
