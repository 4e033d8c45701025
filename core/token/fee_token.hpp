/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace vefee::token {
  using primitives::Account;
  using primitives::TokenAmount;

  enum class FeeTokenError {
    kInsufficientBalance = 1,
    kNegativeAmount,
  };

  /**
   * Balance and transfer primitives of the token being distributed
   */
  class FeeToken {
   public:
    virtual ~FeeToken() = default;

    virtual outcome::result<TokenAmount> balanceOf(
        const Account &holder) const = 0;

    /**
     * Moves amount from one holder to another, fails without side effects
     */
    virtual outcome::result<void> transfer(const Account &from,
                                           const Account &to,
                                           const TokenAmount &amount) = 0;
  };
}  // namespace vefee::token

OUTCOME_HPP_DECLARE_ERROR(vefee::token, FeeTokenError);
