/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vefee::config, ConfigError, e) {
  using vefee::config::ConfigError;

  switch (e) {
    case (ConfigError::kJSONParserError):
      return "ConfigError: JSON parser error";
    case (ConfigError::kBadPath):
      return "ConfigError: config key is wrong";
    case (ConfigError::kCannotOpenFile):
      return "ConfigError: cannot open file";
    case (ConfigError::kInvalidValue):
      return "ConfigError: config value is invalid";
    default:
      return "ConfigError: unknown error";
  }
}
