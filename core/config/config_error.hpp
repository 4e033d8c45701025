/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_VEFEE_CORE_CONFIG_CONFIG_ERROR_HPP
#define CPP_VEFEE_CORE_CONFIG_CONFIG_ERROR_HPP

#include "common/outcome.hpp"

namespace vefee::config {

  /**
   * @brief Config returns these types of errors
   */
  enum class ConfigError {
    kJSONParserError = 1,
    kBadPath,
    kCannotOpenFile,
    kInvalidValue,
  };

}  // namespace vefee::config

OUTCOME_HPP_DECLARE_ERROR(vefee::config, ConfigError);

#endif  // CPP_VEFEE_CORE_CONFIG_CONFIG_ERROR_HPP
