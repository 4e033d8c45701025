/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/voting_power_oracle.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vefee::escrow, VotingPowerOracleError, e) {
  using vefee::escrow::VotingPowerOracleError;
  switch (e) {
    case VotingPowerOracleError::kUnavailable:
      return "VotingPowerOracleError: voting power is not available for "
             "requested time";
    default:
      return "VotingPowerOracleError: unknown error";
  }
}
