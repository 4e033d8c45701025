/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace vefee::distributor {
  enum class FeeDistributorError {
    kPermissionDenied = 1,
    kAdminNotSet,
    kTimeBeforeLastCheckpoint,
    kUnalignedEpoch,
    kNegativeAmount,
  };
}  // namespace vefee::distributor

OUTCOME_HPP_DECLARE_ERROR(vefee::distributor, FeeDistributorError);
