/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "distributor/epoch_ledger.hpp"
#include "escrow/voting_power_oracle.hpp"

namespace vefee::distributor {
  using escrow::VotingPowerOracle;
  using primitives::Account;

  /// Max epochs one claim walks through
  constexpr size_t kMaxClaimEpochs{50};

  /**
   * Computes share of each account in epoch ledgers and keeps per-account
   * cursor of the first epoch not paid yet
   */
  class ClaimEngine {
   public:
    using Cursors = std::map<Account, UnixTime>;

    /**
     * @param start_epoch - no account is paid for epochs before it
     */
    explicit ClaimEngine(UnixTime start_epoch);

    ClaimEngine(UnixTime start_epoch, Cursors cursors);

    /**
     * Sums account share of epochs from its cursor while epoch < limit, at
     * most kMaxClaimEpochs of them, and moves cursor past them.
     * Share of epoch is tokens * balance / supply rounded down, epochs with
     * zero supply give nothing. Account which never locked gets no cursor.
     * @param limit - first epoch which is not payable yet
     * @return amount owed to account, cursor is unchanged on error
     */
    outcome::result<TokenAmount> claim(const Account &account,
                                       const VotingPowerOracle &oracle,
                                       const EpochLedger &tokens,
                                       const EpochLedger &supply,
                                       UnixTime limit);

    boost::optional<UnixTime> cursorOf(const Account &account) const;

    UnixTime startEpoch() const;

    const Cursors &cursors() const;

   private:
    outcome::result<boost::optional<UnixTime>> initialCursor(
        const Account &account, const VotingPowerOracle &oracle) const;

    UnixTime start_epoch_;
    Cursors cursors_;
  };
}  // namespace vefee::distributor
