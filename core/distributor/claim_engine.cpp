/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/claim_engine.hpp"

#include "common/logger.hpp"

namespace vefee::distributor {
  using clock::epochOf;
  using clock::nextEpoch;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("claim");
      return logger.get();
    }
  }  // namespace

  ClaimEngine::ClaimEngine(UnixTime start_epoch)
      : start_epoch_(epochOf(start_epoch)) {}

  ClaimEngine::ClaimEngine(UnixTime start_epoch, Cursors cursors)
      : start_epoch_(epochOf(start_epoch)), cursors_(std::move(cursors)) {}

  outcome::result<boost::optional<UnixTime>> ClaimEngine::initialCursor(
      const Account &account, const VotingPowerOracle &oracle) const {
    auto it = cursors_.find(account);
    if (it != cursors_.end()) {
      return it->second;
    }
    OUTCOME_TRY(first_activity, oracle.firstActivity(account));
    if (!first_activity) {
      return boost::none;
    }
    return std::max(start_epoch_, epochOf(*first_activity));
  }

  outcome::result<TokenAmount> ClaimEngine::claim(
      const Account &account,
      const VotingPowerOracle &oracle,
      const EpochLedger &tokens,
      const EpochLedger &supply,
      UnixTime limit) {
    OUTCOME_TRY(initial, initialCursor(account, oracle));
    if (!initial) {
      log()->debug("{} never locked, nothing to claim", account);
      return TokenAmount{0};
    }

    auto cursor = *initial;
    TokenAmount owed;
    for (size_t i = 0; i < kMaxClaimEpochs && cursor < limit; ++i) {
      const auto epoch_supply = supply.get(cursor);
      if (epoch_supply != 0) {
        OUTCOME_TRY(balance, oracle.balanceOf(account, cursor));
        if (balance != 0) {
          owed += tokens.get(cursor) * balance / epoch_supply;
        }
      }
      cursor = nextEpoch(cursor);
    }

    cursors_[account] = cursor;
    log()->info(
        "{} owed {}, next epoch {}", account, owed.str(), cursor.count());
    return owed;
  }

  boost::optional<UnixTime> ClaimEngine::cursorOf(
      const Account &account) const {
    auto it = cursors_.find(account);
    if (it == cursors_.end()) {
      return boost::none;
    }
    return it->second;
  }

  UnixTime ClaimEngine::startEpoch() const {
    return start_epoch_;
  }

  const ClaimEngine::Cursors &ClaimEngine::cursors() const {
    return cursors_;
  }
}  // namespace vefee::distributor
