/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/supply_checkpointer.hpp"

#include "common/logger.hpp"

namespace vefee::distributor {
  using clock::epochOf;
  using clock::nextEpoch;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("supply_checkpoint");
      return logger.get();
    }
  }  // namespace

  SupplyCheckpointer::SupplyCheckpointer(UnixTime start_epoch)
      : time_cursor_(epochOf(start_epoch)) {}

  SupplyCheckpointer::SupplyCheckpointer(UnixTime time_cursor,
                                         EpochLedger ledger)
      : time_cursor_(time_cursor), ledger_(std::move(ledger)) {}

  outcome::result<size_t> SupplyCheckpointer::checkpoint(
      const VotingPowerOracle &oracle, UnixTime now) {
    const auto rounded = epochOf(now);
    auto cursor = time_cursor_;
    std::vector<std::pair<UnixTime, TokenAmount>> snapshots;
    for (size_t i = 0; i < kMaxSupplyCheckpointEpochs && cursor <= rounded;
         ++i) {
      OUTCOME_TRY(supply, oracle.totalSupply(cursor));
      snapshots.emplace_back(cursor, supply);
      cursor = nextEpoch(cursor);
    }

    auto ledger = ledger_;
    for (const auto &[epoch, supply] : snapshots) {
      OUTCOME_TRY(ledger.put(epoch, supply));
      log()->debug("epoch {} total supply {}", epoch.count(), supply.str());
    }
    ledger_ = std::move(ledger);
    time_cursor_ = cursor;
    return snapshots.size();
  }

  UnixTime SupplyCheckpointer::timeCursor() const {
    return time_cursor_;
  }

  boost::optional<UnixTime> SupplyCheckpointer::lastCheckpointedEpoch() const {
    if (ledger_.entries().empty()) {
      return boost::none;
    }
    return time_cursor_ - clock::kEpochLength;
  }

  TokenAmount SupplyCheckpointer::supplyAt(UnixTime epoch) const {
    return ledger_.get(epoch);
  }

  const EpochLedger &SupplyCheckpointer::ledger() const {
    return ledger_;
  }
}  // namespace vefee::distributor
