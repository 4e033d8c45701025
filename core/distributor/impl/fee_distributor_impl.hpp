/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "clock/utc_clock.hpp"
#include "config/distributor_config.hpp"
#include "distributor/fee_distributor.hpp"
#include "token/fee_token.hpp"

namespace vefee::distributor {
  using clock::UTCClock;
  using config::DistributorConfig;
  using token::FeeToken;

  class FeeDistributorImpl : public FeeDistributor {
   public:
    /**
     * Creates distributor with empty ledgers and takes initial total supply
     * checkpoint
     */
    static outcome::result<std::shared_ptr<FeeDistributorImpl>> create(
        const DistributorConfig &config,
        std::shared_ptr<UTCClock> clock,
        std::shared_ptr<VotingPowerOracle> oracle,
        std::shared_ptr<FeeToken> token);

    /**
     * Restores distributor from saved state
     */
    FeeDistributorImpl(DistributorState state,
                       std::shared_ptr<UTCClock> clock,
                       std::shared_ptr<VotingPowerOracle> oracle,
                       std::shared_ptr<FeeToken> token);

    outcome::result<void> checkpointToken(const Account &caller) override;

    outcome::result<void> checkpointTotalSupply() override;

    outcome::result<TokenAmount> claim(const Account &account) override;

    outcome::result<TokenAmount> claimMany(
        const std::vector<Account> &accounts) override;

    outcome::result<void> toggleAllowCheckpointToken(
        const Account &caller) override;

    outcome::result<void> commitAdmin(const Account &caller,
                                      const Account &future_admin) override;

    outcome::result<void> applyAdmin(const Account &caller) override;

    TokenAmount tokensPerEpoch(UnixTime epoch) const override;

    TokenAmount veSupply(UnixTime epoch) const override;

    UnixTime timeCursor() const override;

    boost::optional<UnixTime> timeCursorOf(
        const Account &account) const override;

    UnixTime lastTokenTime() const override;

    TokenAmount tokenLastBalance() const override;

    UnixTime startTime() const override;

    const Account &admin() const override;

    const boost::optional<Account> &futureAdmin() const override;

    bool canCheckpointToken() const override;

    const DistributorState &state() const override;

   private:
    /// Checkpoints required before paying anything at now
    outcome::result<void> prepareClaim(DistributorState &state,
                                       UnixTime now) const;

    outcome::result<void> checkpointTokenAt(DistributorState &state,
                                            UnixTime now) const;

    /// Computes and transfers account share, state is updated only on success
    outcome::result<TokenAmount> payout(DistributorState &state,
                                        const Account &account) const;

    DistributorState state_;
    std::shared_ptr<UTCClock> clock_;
    std::shared_ptr<VotingPowerOracle> oracle_;
    std::shared_ptr<FeeToken> token_;
  };
}  // namespace vefee::distributor
