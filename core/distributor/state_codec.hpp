/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/property_tree/ptree.hpp>

#include "distributor/distributor_state.hpp"

namespace vefee::distributor {
  enum class StateCodecError {
    kCannotOpenFile = 1,
    kJSONParserError,
    kMissingField,
    kInvalidAmount,
    kInvalidEpoch,
    kDuplicateEntry,
  };

  /**
   * Encodes state as property tree, amounts are decimal strings and times are
   * unix seconds
   */
  boost::property_tree::ptree encodeState(const DistributorState &state);

  outcome::result<DistributorState> decodeState(
      const boost::property_tree::ptree &tree);

  /**
   * Writes state as JSON document
   */
  outcome::result<void> saveState(const DistributorState &state,
                                  const std::string &filename);

  outcome::result<DistributorState> loadState(const std::string &filename);
}  // namespace vefee::distributor

OUTCOME_HPP_DECLARE_ERROR(vefee::distributor, StateCodecError);
