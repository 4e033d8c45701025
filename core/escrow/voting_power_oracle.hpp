/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "clock/time.hpp"
#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace vefee::escrow {
  using clock::UnixTime;
  using primitives::Account;
  using primitives::TokenAmount;

  enum class VotingPowerOracleError {
    kUnavailable = 1,
  };

  /**
   * Historical view of the voting-escrow lock engine. Voting power of a lock
   * decays linearly until lock end and is zero after expiry or withdrawal.
   * Answers must be deterministic for any time since the escrow genesis.
   */
  class VotingPowerOracle {
   public:
    virtual ~VotingPowerOracle() = default;

    /**
     * Voting power of account at given time
     * @return zero if account had no active lock at that time
     */
    virtual outcome::result<TokenAmount> balanceOf(const Account &account,
                                                   UnixTime time) const = 0;

    /**
     * Sum of voting power of all accounts at given time
     */
    virtual outcome::result<TokenAmount> totalSupply(UnixTime time) const = 0;

    /**
     * Time of the first lock action recorded for account
     * @return none if account never locked
     */
    virtual outcome::result<boost::optional<UnixTime>> firstActivity(
        const Account &account) const = 0;
  };
}  // namespace vefee::escrow

OUTCOME_HPP_DECLARE_ERROR(vefee::escrow, VotingPowerOracleError);
