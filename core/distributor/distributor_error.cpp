/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/distributor_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vefee::distributor, FeeDistributorError, e) {
  using vefee::distributor::FeeDistributorError;
  switch (e) {
    case FeeDistributorError::kPermissionDenied:
      return "FeeDistributorError: caller is not allowed to do this";
    case FeeDistributorError::kAdminNotSet:
      return "FeeDistributorError: future admin is not committed";
    case FeeDistributorError::kTimeBeforeLastCheckpoint:
      return "FeeDistributorError: current time precedes last token "
             "checkpoint";
    case FeeDistributorError::kUnalignedEpoch:
      return "FeeDistributorError: time is not aligned to epoch boundary";
    case FeeDistributorError::kNegativeAmount:
      return "FeeDistributorError: amount is negative";
    default:
      return "FeeDistributorError: unknown error";
  }
}
