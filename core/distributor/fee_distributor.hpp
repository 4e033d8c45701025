/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "distributor/distributor_state.hpp"

namespace vefee::distributor {
  /**
   * Distributes fee token sent to distributor address among voting-escrow
   * lockers, epoch by epoch, proportionally to their share of voting power at
   * epoch start. Every mutating call either commits completely or leaves
   * state as it was.
   */
  class FeeDistributor {
   public:
    virtual ~FeeDistributor() = default;

    /**
     * Credits fee token received since previous token checkpoint to epochs
     * @param caller - admin, or anyone when public checkpoints are allowed
     * and cooldown has passed
     */
    virtual outcome::result<void> checkpointToken(const Account &caller) = 0;

    /**
     * Snapshots total voting power of epochs up to current one
     */
    virtual outcome::result<void> checkpointTotalSupply() = 0;

    /**
     * Pays account its share of fully elapsed checkpointed epochs
     * @return amount transferred, may be zero
     */
    virtual outcome::result<TokenAmount> claim(const Account &account) = 0;

    /**
     * Claims for several accounts, empty account id terminates the list.
     * Accounts paid before a failure stay paid.
     * @return total amount transferred
     */
    virtual outcome::result<TokenAmount> claimMany(
        const std::vector<Account> &accounts) = 0;

    virtual outcome::result<void> toggleAllowCheckpointToken(
        const Account &caller) = 0;

    virtual outcome::result<void> commitAdmin(const Account &caller,
                                              const Account &future_admin) = 0;

    virtual outcome::result<void> applyAdmin(const Account &caller) = 0;

    /// Fee token credited to epoch
    virtual TokenAmount tokensPerEpoch(UnixTime epoch) const = 0;

    /// Total voting power snapshot of epoch
    virtual TokenAmount veSupply(UnixTime epoch) const = 0;

    /// First epoch without total supply snapshot
    virtual UnixTime timeCursor() const = 0;

    /// First epoch not paid to account yet
    virtual boost::optional<UnixTime> timeCursorOf(
        const Account &account) const = 0;

    virtual UnixTime lastTokenTime() const = 0;

    virtual TokenAmount tokenLastBalance() const = 0;

    virtual UnixTime startTime() const = 0;

    virtual const Account &admin() const = 0;

    virtual const boost::optional<Account> &futureAdmin() const = 0;

    virtual bool canCheckpointToken() const = 0;

    virtual const DistributorState &state() const = 0;
  };
}  // namespace vefee::distributor
