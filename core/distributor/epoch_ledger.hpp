/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "clock/epoch_clock.hpp"
#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace vefee::distributor {
  using clock::UnixTime;
  using primitives::TokenAmount;

  /**
   * Amounts indexed by epoch start. Missing epochs read as zero. Entries are
   * never removed and only grow, so history once paid out stays stable.
   */
  class EpochLedger {
   public:
    using Entries = std::map<UnixTime, TokenAmount>;

    EpochLedger() = default;

    /**
     * Restores ledger from previously saved entries
     */
    explicit EpochLedger(Entries entries);

    TokenAmount get(UnixTime epoch) const;

    bool has(UnixTime epoch) const;

    /**
     * Increments amount of epoch
     * @param epoch - epoch start
     * @param amount - non-negative increment
     */
    outcome::result<void> add(UnixTime epoch, const TokenAmount &amount);

    /**
     * Stores snapshot value of epoch, replacing previous one
     */
    outcome::result<void> put(UnixTime epoch, const TokenAmount &amount);

    /// Sum of all entries
    TokenAmount total() const;

    const Entries &entries() const;

   private:
    Entries entries_;
  };
}  // namespace vefee::distributor
