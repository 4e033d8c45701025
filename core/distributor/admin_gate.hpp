/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "clock/epoch_clock.hpp"
#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace vefee::distributor {
  using clock::UnixTime;
  using primitives::Account;

  /// Default delay between token checkpoints triggered by non-admins
  constexpr UnixTime kTokenCheckpointCooldown{clock::kDay};

  /**
   * Admin identity and rules of who may checkpoint token balance and when
   */
  class AdminGate {
   public:
    AdminGate(Account admin,
              bool can_checkpoint_token,
              UnixTime checkpoint_cooldown = kTokenCheckpointCooldown);

    AdminGate(Account admin,
              boost::optional<Account> future_admin,
              bool can_checkpoint_token,
              UnixTime checkpoint_cooldown);

    /**
     * Enables or disables token checkpoints by anyone
     */
    outcome::result<void> toggleAllowCheckpointToken(const Account &caller);

    /**
     * First step of admin rotation
     */
    outcome::result<void> commitAdmin(const Account &caller,
                                      const Account &future_admin);

    /**
     * Second step of admin rotation, makes committed future admin current
     */
    outcome::result<void> applyAdmin(const Account &caller);

    /**
     * Admin may always checkpoint, others only if public checkpoints are
     * allowed and cooldown since last checkpoint has passed
     */
    outcome::result<void> checkCanCheckpointToken(
        const Account &caller, UnixTime now, UnixTime last_token_time) const;

    /// Whether claim should checkpoint token balance before paying
    bool shouldAutoCheckpoint(UnixTime now, UnixTime last_token_time) const;

    const Account &admin() const;

    const boost::optional<Account> &futureAdmin() const;

    bool canCheckpointToken() const;

    UnixTime checkpointCooldown() const;

   private:
    outcome::result<void> assertAdmin(const Account &caller) const;

    Account admin_;
    boost::optional<Account> future_admin_;
    bool can_checkpoint_token_;
    UnixTime checkpoint_cooldown_;
  };
}  // namespace vefee::distributor
