/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "distributor/epoch_ledger.hpp"

namespace vefee::distributor {
  /**
   * Credits fee token received since previous checkpoint to the epochs the
   * elapsed interval covers, proportionally to time spent in each epoch
   */
  class TokenCheckpointer {
   public:
    /**
     * @param start_epoch - time the first checkpoint interval begins at
     */
    explicit TokenCheckpointer(UnixTime start_epoch);

    TokenCheckpointer(UnixTime last_token_time,
                      TokenAmount token_last_balance,
                      EpochLedger ledger);

    /**
     * Reconciles distributor balance into the ledger.
     * Delta of balance since previous checkpoint is split at epoch
     * boundaries over [last_token_time, now). Each piece gets
     * delta * piece / interval rounded down, the last piece gets the
     * remainder, so the whole delta is credited. Non-positive delta only
     * moves the cursor.
     * @param now - current time, not before last checkpoint
     * @param balance - fee token balance of distributor at now
     * @return amount credited
     */
    outcome::result<TokenAmount> checkpoint(UnixTime now,
                                            const TokenAmount &balance);

    /**
     * Accounts tokens leaving distributor as claims, so they are not seen as
     * negative deposit by next checkpoint
     */
    outcome::result<void> recordPayout(const TokenAmount &amount);

    UnixTime lastTokenTime() const;

    const TokenAmount &tokenLastBalance() const;

    TokenAmount tokensAt(UnixTime epoch) const;

    const EpochLedger &ledger() const;

   private:
    UnixTime last_token_time_;
    TokenAmount token_last_balance_;
    EpochLedger ledger_;
  };
}  // namespace vefee::distributor
