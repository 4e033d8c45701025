/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/token_checkpointer.hpp"

#include "common/logger.hpp"
#include "distributor/distributor_error.hpp"

namespace vefee::distributor {
  using clock::epochOf;
  using clock::nextEpoch;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("token_checkpoint");
      return logger.get();
    }
  }  // namespace

  TokenCheckpointer::TokenCheckpointer(UnixTime start_epoch)
      : last_token_time_(start_epoch), token_last_balance_(0) {}

  TokenCheckpointer::TokenCheckpointer(UnixTime last_token_time,
                                       TokenAmount token_last_balance,
                                       EpochLedger ledger)
      : last_token_time_(last_token_time),
        token_last_balance_(std::move(token_last_balance)),
        ledger_(std::move(ledger)) {}

  outcome::result<TokenAmount> TokenCheckpointer::checkpoint(
      UnixTime now, const TokenAmount &balance) {
    if (now < last_token_time_) {
      return outcome::failure(FeeDistributorError::kTimeBeforeLastCheckpoint);
    }
    TokenAmount delta = balance - token_last_balance_;
    if (delta <= 0) {
      if (delta < 0) {
        log()->warn("balance {} below last checkpoint balance {}",
                    balance.str(),
                    token_last_balance_.str());
      }
      last_token_time_ = now;
      token_last_balance_ = balance;
      return TokenAmount{0};
    }

    auto ledger = ledger_;
    auto t = last_token_time_;
    const auto since_last = (now - t).count();
    auto this_epoch = epochOf(t);
    TokenAmount credited;
    while (true) {
      const auto next_epoch = nextEpoch(this_epoch);
      if (now <= next_epoch) {
        OUTCOME_TRY(ledger.add(this_epoch, delta - credited));
        break;
      }
      TokenAmount share = delta * (next_epoch - t).count() / since_last;
      OUTCOME_TRY(ledger.add(this_epoch, share));
      credited += share;
      t = next_epoch;
      this_epoch = next_epoch;
    }

    log()->debug("credited {} over [{}, {})",
                 delta.str(),
                 last_token_time_.count(),
                 now.count());
    ledger_ = std::move(ledger);
    last_token_time_ = now;
    token_last_balance_ = balance;
    return delta;
  }

  outcome::result<void> TokenCheckpointer::recordPayout(
      const TokenAmount &amount) {
    if (amount < 0) {
      return FeeDistributorError::kNegativeAmount;
    }
    token_last_balance_ -= amount;
    return outcome::success();
  }

  UnixTime TokenCheckpointer::lastTokenTime() const {
    return last_token_time_;
  }

  const TokenAmount &TokenCheckpointer::tokenLastBalance() const {
    return token_last_balance_;
  }

  TokenAmount TokenCheckpointer::tokensAt(UnixTime epoch) const {
    return ledger_.get(epoch);
  }

  const EpochLedger &TokenCheckpointer::ledger() const {
    return ledger_;
  }
}  // namespace vefee::distributor
