/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "distributor/epoch_ledger.hpp"
#include "escrow/voting_power_oracle.hpp"

namespace vefee::distributor {
  using escrow::VotingPowerOracle;

  /// Max epochs snapshotted by one checkpoint call
  constexpr size_t kMaxSupplyCheckpointEpochs{20};

  /**
   * Records total voting power at every epoch boundary
   */
  class SupplyCheckpointer {
   public:
    /**
     * @param start_epoch - first epoch to snapshot
     */
    explicit SupplyCheckpointer(UnixTime start_epoch);

    SupplyCheckpointer(UnixTime time_cursor, EpochLedger ledger);

    /**
     * Snapshots epochs from cursor up to and including epoch of now, at most
     * kMaxSupplyCheckpointEpochs of them. State is unchanged on error.
     * @return number of epochs snapshotted
     */
    outcome::result<size_t> checkpoint(const VotingPowerOracle &oracle,
                                       UnixTime now);

    /// First epoch without snapshot
    UnixTime timeCursor() const;

    boost::optional<UnixTime> lastCheckpointedEpoch() const;

    TokenAmount supplyAt(UnixTime epoch) const;

    const EpochLedger &ledger() const;

   private:
    UnixTime time_cursor_;
    EpochLedger ledger_;
  };
}  // namespace vefee::distributor
