/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_VEFEE_CORE_CLOCK_EPOCH_CLOCK_HPP
#define CPP_VEFEE_CORE_CLOCK_EPOCH_CLOCK_HPP

#include "clock/time.hpp"

namespace vefee::clock {
  constexpr UnixTime kDay{86400};

  /// Length of a distribution epoch, every ledger index is a multiple of it
  constexpr UnixTime kEpochLength{7 * kDay};

  /**
   * Start of the epoch containing given time
   * @param time - non-negative unix time
   */
  constexpr UnixTime epochOf(UnixTime time) {
    return time / kEpochLength * kEpochLength;
  }

  constexpr UnixTime nextEpoch(UnixTime epoch) {
    return epoch + kEpochLength;
  }

  /// First epoch boundary at or after given time
  constexpr UnixTime epochCeil(UnixTime time) {
    return epochOf(time + kEpochLength - UnixTime{1});
  }

  constexpr bool isEpochAligned(UnixTime time) {
    return time % kEpochLength == UnixTime{0};
  }
}  // namespace vefee::clock

#endif  // CPP_VEFEE_CORE_CLOCK_EPOCH_CLOCK_HPP
