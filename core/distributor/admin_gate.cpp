/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/admin_gate.hpp"

#include "common/logger.hpp"
#include "distributor/distributor_error.hpp"

namespace vefee::distributor {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("admin");
      return logger.get();
    }
  }  // namespace

  AdminGate::AdminGate(Account admin,
                       bool can_checkpoint_token,
                       UnixTime checkpoint_cooldown)
      : AdminGate(std::move(admin),
                  boost::none,
                  can_checkpoint_token,
                  checkpoint_cooldown) {}

  AdminGate::AdminGate(Account admin,
                       boost::optional<Account> future_admin,
                       bool can_checkpoint_token,
                       UnixTime checkpoint_cooldown)
      : admin_(std::move(admin)),
        future_admin_(std::move(future_admin)),
        can_checkpoint_token_(can_checkpoint_token),
        checkpoint_cooldown_(checkpoint_cooldown) {}

  outcome::result<void> AdminGate::assertAdmin(const Account &caller) const {
    if (caller != admin_) {
      log()->warn("{} is not admin", caller);
      return FeeDistributorError::kPermissionDenied;
    }
    return outcome::success();
  }

  outcome::result<void> AdminGate::toggleAllowCheckpointToken(
      const Account &caller) {
    OUTCOME_TRY(assertAdmin(caller));
    can_checkpoint_token_ = !can_checkpoint_token_;
    log()->info("public token checkpoint {}",
                can_checkpoint_token_ ? "allowed" : "disallowed");
    return outcome::success();
  }

  outcome::result<void> AdminGate::commitAdmin(const Account &caller,
                                               const Account &future_admin) {
    OUTCOME_TRY(assertAdmin(caller));
    future_admin_ = future_admin;
    log()->info("committed future admin {}", future_admin);
    return outcome::success();
  }

  outcome::result<void> AdminGate::applyAdmin(const Account &caller) {
    OUTCOME_TRY(assertAdmin(caller));
    if (!future_admin_) {
      return FeeDistributorError::kAdminNotSet;
    }
    admin_ = *future_admin_;
    future_admin_ = boost::none;
    log()->info("applied admin {}", admin_);
    return outcome::success();
  }

  outcome::result<void> AdminGate::checkCanCheckpointToken(
      const Account &caller, UnixTime now, UnixTime last_token_time) const {
    if (caller == admin_ || shouldAutoCheckpoint(now, last_token_time)) {
      return outcome::success();
    }
    log()->warn("{} may not checkpoint token now", caller);
    return FeeDistributorError::kPermissionDenied;
  }

  bool AdminGate::shouldAutoCheckpoint(UnixTime now,
                                       UnixTime last_token_time) const {
    return can_checkpoint_token_
           && now > last_token_time + checkpoint_cooldown_;
  }

  const Account &AdminGate::admin() const {
    return admin_;
  }

  const boost::optional<Account> &AdminGate::futureAdmin() const {
    return future_admin_;
  }

  bool AdminGate::canCheckpointToken() const {
    return can_checkpoint_token_;
  }

  UnixTime AdminGate::checkpointCooldown() const {
    return checkpoint_cooldown_;
  }
}  // namespace vefee::distributor
