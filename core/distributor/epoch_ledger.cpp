/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/epoch_ledger.hpp"

#include "distributor/distributor_error.hpp"

namespace vefee::distributor {
  namespace {
    outcome::result<void> validate(UnixTime epoch, const TokenAmount &amount) {
      if (!clock::isEpochAligned(epoch)) {
        return FeeDistributorError::kUnalignedEpoch;
      }
      if (amount < 0) {
        return FeeDistributorError::kNegativeAmount;
      }
      return outcome::success();
    }
  }  // namespace

  EpochLedger::EpochLedger(Entries entries) : entries_(std::move(entries)) {}

  TokenAmount EpochLedger::get(UnixTime epoch) const {
    auto it = entries_.find(epoch);
    if (it == entries_.end()) {
      return 0;
    }
    return it->second;
  }

  bool EpochLedger::has(UnixTime epoch) const {
    return entries_.find(epoch) != entries_.end();
  }

  outcome::result<void> EpochLedger::add(UnixTime epoch,
                                         const TokenAmount &amount) {
    OUTCOME_TRY(validate(epoch, amount));
    entries_[epoch] += amount;
    return outcome::success();
  }

  outcome::result<void> EpochLedger::put(UnixTime epoch,
                                         const TokenAmount &amount) {
    OUTCOME_TRY(validate(epoch, amount));
    entries_[epoch] = amount;
    return outcome::success();
  }

  TokenAmount EpochLedger::total() const {
    TokenAmount total;
    for (const auto &entry : entries_) {
      total += entry.second;
    }
    return total;
  }

  const EpochLedger::Entries &EpochLedger::entries() const {
    return entries_;
  }
}  // namespace vefee::distributor
