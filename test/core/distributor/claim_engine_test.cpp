/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/claim_engine.hpp"

#include <gtest/gtest.h>

#include "testutil/mocks/escrow/voting_power_oracle_mock.hpp"
#include "testutil/outcome.hpp"

using vefee::clock::kDay;
using vefee::clock::kEpochLength;
using vefee::clock::UnixTime;
using vefee::distributor::ClaimEngine;
using vefee::distributor::EpochLedger;
using vefee::distributor::kMaxClaimEpochs;
using vefee::escrow::VotingPowerOracleError;
using vefee::escrow::VotingPowerOracleMock;
using vefee::primitives::TokenAmount;
using testing::_;
using testing::Return;

namespace outcome = vefee::outcome;

static UnixTime kEpoch{1609977600};

class ClaimEngineTest : public ::testing::Test {
 public:
  void SetUp() override {
    ON_CALL(oracle, firstActivity("alice"))
        .WillByDefault(Return(boost::make_optional(kEpoch - 3 * kDay)));
    ON_CALL(oracle, firstActivity("nobody"))
        .WillByDefault(Return(boost::optional<UnixTime>{}));
    ON_CALL(oracle, balanceOf("alice", _))
        .WillByDefault(Return(TokenAmount{100}));
  }

  UnixTime epoch(int64_t i) const {
    return kEpoch + kEpochLength * i;
  }

  /// Same tokens and supply for first n epochs
  void fill(int64_t n,
            const TokenAmount &per_epoch,
            const TokenAmount &supply) {
    for (int64_t i = 0; i < n; ++i) {
      EXPECT_OUTCOME_TRUE_1(tokens.add(epoch(i), per_epoch));
      EXPECT_OUTCOME_TRUE_1(supplies.put(epoch(i), supply));
    }
  }

  testing::NiceMock<VotingPowerOracleMock> oracle;
  EpochLedger tokens;
  EpochLedger supplies;
  ClaimEngine engine{kEpoch};
};

/**
 * @given account without any lock
 * @when claim
 * @then nothing owed, no cursor created
 */
TEST_F(ClaimEngineTest, NeverLocked) {
  fill(2, 1000, 300);
  EXPECT_OUTCOME_EQ(engine.claim("nobody", oracle, tokens, supplies, epoch(2)),
                    TokenAmount{0});
  EXPECT_FALSE(engine.cursorOf("nobody"));
}

/**
 * @given account locked before start
 * @when claim two epochs
 * @then share of each epoch rounded down, cursor after them
 */
TEST_F(ClaimEngineTest, ProportionalShare) {
  fill(2, 1000, 300);
  EXPECT_OUTCOME_EQ(engine.claim("alice", oracle, tokens, supplies, epoch(2)),
                    TokenAmount{666});
  EXPECT_EQ(engine.cursorOf("alice").value(), epoch(2));
}

/**
 * @given account locked in the middle of second epoch
 * @when claim
 * @then walk starts at epoch of first lock
 */
TEST_F(ClaimEngineTest, StartsAtFirstActivity) {
  fill(3, 1000, 100);
  EXPECT_CALL(oracle, firstActivity("bob"))
      .WillOnce(Return(boost::make_optional(epoch(1) + 2 * kDay)));
  EXPECT_CALL(oracle, balanceOf("bob", _)).Times(0);
  EXPECT_CALL(oracle, balanceOf("bob", epoch(2)))
      .WillOnce(Return(TokenAmount{50}));
  EXPECT_CALL(oracle, balanceOf("bob", epoch(1)))
      .WillOnce(Return(TokenAmount{0}));
  EXPECT_OUTCOME_EQ(engine.claim("bob", oracle, tokens, supplies, epoch(3)),
                    TokenAmount{500});
}

/**
 * @given epoch without voting power
 * @when claim
 * @then epoch gives nothing and balance is not asked
 */
TEST_F(ClaimEngineTest, ZeroSupplyEpoch) {
  fill(2, 1000, 100);
  EXPECT_OUTCOME_TRUE_1(supplies.put(epoch(0), 0));
  EXPECT_CALL(oracle, balanceOf("alice", _)).Times(0);
  EXPECT_CALL(oracle, balanceOf("alice", epoch(1)))
      .WillOnce(Return(TokenAmount{100}));
  EXPECT_OUTCOME_EQ(engine.claim("alice", oracle, tokens, supplies, epoch(2)),
                    TokenAmount{1000});
}

/**
 * @given claimed account
 * @when claim again without new epochs
 * @then nothing owed
 */
TEST_F(ClaimEngineTest, NoDoublePayment) {
  fill(2, 1000, 100);
  EXPECT_OUTCOME_EQ(engine.claim("alice", oracle, tokens, supplies, epoch(2)),
                    TokenAmount{2000});
  EXPECT_OUTCOME_EQ(engine.claim("alice", oracle, tokens, supplies, epoch(2)),
                    TokenAmount{0});
  EXPECT_EQ(engine.cursorOf("alice").value(), epoch(2));
}

/**
 * @given tokens in epochs not final yet
 * @when claim with limit before them
 * @then they are left for later claims
 */
TEST_F(ClaimEngineTest, Limit) {
  fill(3, 1000, 100);
  EXPECT_OUTCOME_EQ(engine.claim("alice", oracle, tokens, supplies, epoch(1)),
                    TokenAmount{1000});
  EXPECT_EQ(engine.cursorOf("alice").value(), epoch(1));
  EXPECT_OUTCOME_EQ(engine.claim("alice", oracle, tokens, supplies, epoch(3)),
                    TokenAmount{2000});
}

/**
 * @given more pending epochs than one claim walks
 * @when claim repeatedly
 * @then each claim pays its part and resumes from cursor
 */
TEST_F(ClaimEngineTest, BoundedWalk) {
  const int64_t pending = kMaxClaimEpochs + 10;
  fill(pending, 10, 100);
  EXPECT_OUTCOME_EQ(
      engine.claim("alice", oracle, tokens, supplies, epoch(pending)),
      TokenAmount{10 * kMaxClaimEpochs});
  EXPECT_EQ(engine.cursorOf("alice").value(), epoch(kMaxClaimEpochs));
  EXPECT_OUTCOME_EQ(
      engine.claim("alice", oracle, tokens, supplies, epoch(pending)),
      TokenAmount{100});
  EXPECT_EQ(engine.cursorOf("alice").value(), epoch(pending));
}

/**
 * @given oracle failing
 * @when claim
 * @then error, cursor not created
 */
TEST_F(ClaimEngineTest, OracleUnavailable) {
  fill(2, 1000, 100);
  EXPECT_CALL(oracle, balanceOf("alice", _))
      .WillRepeatedly(
          Return(outcome::failure(VotingPowerOracleError::kUnavailable)));
  EXPECT_OUTCOME_ERROR(
      VotingPowerOracleError::kUnavailable,
      engine.claim("alice", oracle, tokens, supplies, epoch(2)));
  EXPECT_FALSE(engine.cursorOf("alice"));
}

/**
 * @given restored cursors
 * @when claim
 * @then walk continues from restored cursor
 */
TEST_F(ClaimEngineTest, RestoredCursor) {
  fill(3, 1000, 100);
  ClaimEngine restored{kEpoch, {{"alice", epoch(2)}}};
  EXPECT_OUTCOME_EQ(
      restored.claim("alice", oracle, tokens, supplies, epoch(3)),
      TokenAmount{1000});
}
