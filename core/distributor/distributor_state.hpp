/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "distributor/admin_gate.hpp"
#include "distributor/claim_engine.hpp"
#include "distributor/supply_checkpointer.hpp"
#include "distributor/token_checkpointer.hpp"

namespace vefee::distributor {
  /**
   * Everything fee distributor persists. Ledgers are owned by their
   * checkpointers, account cursors by claim engine.
   */
  struct DistributorState {
    /// Holder of fee token balance being distributed
    Account address;
    /// Epoch start, earlier epochs are never paid
    UnixTime start_time;
    AdminGate admin;
    TokenCheckpointer tokens;
    SupplyCheckpointer supply;
    ClaimEngine claims;
  };
}  // namespace vefee::distributor
