/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/impl/fee_distributor_impl.hpp"

#include <algorithm>

#include "common/logger.hpp"

namespace vefee::distributor {
  using clock::epochOf;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("fee_distributor");
      return logger.get();
    }
  }  // namespace

  outcome::result<std::shared_ptr<FeeDistributorImpl>>
  FeeDistributorImpl::create(const DistributorConfig &config,
                             std::shared_ptr<UTCClock> clock,
                             std::shared_ptr<VotingPowerOracle> oracle,
                             std::shared_ptr<FeeToken> token) {
    const auto start_epoch = epochOf(config.start_time);
    DistributorState state{
        config.address,
        start_epoch,
        AdminGate{config.admin,
                  config.can_checkpoint_token,
                  config.checkpoint_cooldown},
        TokenCheckpointer{start_epoch},
        SupplyCheckpointer{start_epoch},
        ClaimEngine{start_epoch},
    };
    OUTCOME_TRY(state.supply.checkpoint(*oracle, clock->nowUTC()));
    log()->info("created distributor {} starting at {}",
                config.address,
                clock::unixTimeToString(start_epoch));
    return std::make_shared<FeeDistributorImpl>(std::move(state),
                                                std::move(clock),
                                                std::move(oracle),
                                                std::move(token));
  }

  FeeDistributorImpl::FeeDistributorImpl(
      DistributorState state,
      std::shared_ptr<UTCClock> clock,
      std::shared_ptr<VotingPowerOracle> oracle,
      std::shared_ptr<FeeToken> token)
      : state_(std::move(state)),
        clock_(std::move(clock)),
        oracle_(std::move(oracle)),
        token_(std::move(token)) {}

  outcome::result<void> FeeDistributorImpl::checkpointTokenAt(
      DistributorState &state, UnixTime now) const {
    OUTCOME_TRY(balance, token_->balanceOf(state.address));
    OUTCOME_TRY(credited, state.tokens.checkpoint(now, balance));
    log()->debug("token checkpoint at {}, credited {}",
                 now.count(),
                 credited.str());
    return outcome::success();
  }

  outcome::result<void> FeeDistributorImpl::checkpointToken(
      const Account &caller) {
    const auto now = clock_->nowUTC();
    OUTCOME_TRY(state_.admin.checkCanCheckpointToken(
        caller, now, state_.tokens.lastTokenTime()));
    return checkpointTokenAt(state_, now);
  }

  outcome::result<void> FeeDistributorImpl::checkpointTotalSupply() {
    OUTCOME_TRY(state_.supply.checkpoint(*oracle_, clock_->nowUTC()));
    return outcome::success();
  }

  outcome::result<void> FeeDistributorImpl::prepareClaim(
      DistributorState &state, UnixTime now) const {
    if (now >= state.supply.timeCursor()) {
      OUTCOME_TRY(state.supply.checkpoint(*oracle_, now));
    }
    if (state.admin.shouldAutoCheckpoint(now, state.tokens.lastTokenTime())) {
      OUTCOME_TRY(checkpointTokenAt(state, now));
    }
    return outcome::success();
  }

  outcome::result<TokenAmount> FeeDistributorImpl::payout(
      DistributorState &state, const Account &account) const {
    // current epoch may still receive tokens, so only epochs before the one
    // of last token checkpoint are final
    const auto limit = std::min(epochOf(state.tokens.lastTokenTime()),
                                state.supply.timeCursor());
    auto claims = state.claims;
    OUTCOME_TRY(amount,
                claims.claim(account,
                             *oracle_,
                             state.tokens.ledger(),
                             state.supply.ledger(),
                             limit));
    auto tokens = state.tokens;
    if (amount != 0) {
      auto transferred = token_->transfer(state.address, account, amount);
      if (!transferred) {
        log()->error("transfer of {} to {} failed: {}",
                     amount.str(),
                     account,
                     transferred.error().message());
        return transferred.error();
      }
      OUTCOME_TRY(tokens.recordPayout(amount));
    }
    state.claims = std::move(claims);
    state.tokens = std::move(tokens);
    return amount;
  }

  outcome::result<TokenAmount> FeeDistributorImpl::claim(
      const Account &account) {
    auto next = state_;
    OUTCOME_TRY(prepareClaim(next, clock_->nowUTC()));
    OUTCOME_TRY(amount, payout(next, account));
    state_ = std::move(next);
    return amount;
  }

  outcome::result<TokenAmount> FeeDistributorImpl::claimMany(
      const std::vector<Account> &accounts) {
    auto next = state_;
    OUTCOME_TRY(prepareClaim(next, clock_->nowUTC()));
    TokenAmount total;
    bool paid_any = false;
    for (const auto &account : accounts) {
      if (account.empty()) {
        break;
      }
      auto paid = payout(next, account);
      if (!paid) {
        // tokens already sent cannot be taken back, keep their accounting
        if (paid_any) {
          state_ = std::move(next);
        }
        return paid.error();
      }
      if (paid.value() != 0) {
        paid_any = true;
      }
      total += paid.value();
    }
    state_ = std::move(next);
    return total;
  }

  outcome::result<void> FeeDistributorImpl::toggleAllowCheckpointToken(
      const Account &caller) {
    return state_.admin.toggleAllowCheckpointToken(caller);
  }

  outcome::result<void> FeeDistributorImpl::commitAdmin(
      const Account &caller, const Account &future_admin) {
    return state_.admin.commitAdmin(caller, future_admin);
  }

  outcome::result<void> FeeDistributorImpl::applyAdmin(const Account &caller) {
    return state_.admin.applyAdmin(caller);
  }

  TokenAmount FeeDistributorImpl::tokensPerEpoch(UnixTime epoch) const {
    return state_.tokens.tokensAt(epoch);
  }

  TokenAmount FeeDistributorImpl::veSupply(UnixTime epoch) const {
    return state_.supply.supplyAt(epoch);
  }

  UnixTime FeeDistributorImpl::timeCursor() const {
    return state_.supply.timeCursor();
  }

  boost::optional<UnixTime> FeeDistributorImpl::timeCursorOf(
      const Account &account) const {
    return state_.claims.cursorOf(account);
  }

  UnixTime FeeDistributorImpl::lastTokenTime() const {
    return state_.tokens.lastTokenTime();
  }

  TokenAmount FeeDistributorImpl::tokenLastBalance() const {
    return state_.tokens.tokenLastBalance();
  }

  UnixTime FeeDistributorImpl::startTime() const {
    return state_.start_time;
  }

  const Account &FeeDistributorImpl::admin() const {
    return state_.admin.admin();
  }

  const boost::optional<Account> &FeeDistributorImpl::futureAdmin() const {
    return state_.admin.futureAdmin();
  }

  bool FeeDistributorImpl::canCheckpointToken() const {
    return state_.admin.canCheckpointToken();
  }

  const DistributorState &FeeDistributorImpl::state() const {
    return state_;
  }
}  // namespace vefee::distributor
