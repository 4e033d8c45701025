/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/fee_token.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vefee::token, FeeTokenError, e) {
  using vefee::token::FeeTokenError;
  switch (e) {
    case FeeTokenError::kInsufficientBalance:
      return "FeeTokenError: insufficient balance";
    case FeeTokenError::kNegativeAmount:
      return "FeeTokenError: amount is negative";
    default:
      return "FeeTokenError: unknown error";
  }
}
