/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/epoch_clock.hpp"
#include "config/config.hpp"
#include "primitives/types.hpp"

namespace vefee::config {
  using clock::UnixTime;
  using primitives::Account;

  constexpr auto kDefaultDistributorAddress{"fee_distributor"};

  /**
   * Construction parameters of fee distributor
   */
  struct DistributorConfig {
    /// Account holding fee token to distribute
    Account address{kDefaultDistributorAddress};
    Account admin;
    /// Rounded down to epoch, earlier epochs are never paid
    UnixTime start_time{};
    /// Min time between token checkpoints not made by admin
    UnixTime checkpoint_cooldown{clock::kDay};
    bool can_checkpoint_token{false};
  };

  /**
   * Reads "distributor" section of config.
   * start_time and admin are required, other keys have defaults.
   */
  outcome::result<DistributorConfig> loadDistributorConfig(
      const Config &config);
}  // namespace vefee::config
