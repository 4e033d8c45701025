/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/impl/in_memory_fee_token.hpp"

namespace vefee::token {
  outcome::result<TokenAmount> InMemoryFeeToken::balanceOf(
      const Account &holder) const {
    auto it = balances_.find(holder);
    if (it == balances_.end()) {
      return TokenAmount{0};
    }
    return it->second;
  }

  outcome::result<void> InMemoryFeeToken::transfer(const Account &from,
                                                   const Account &to,
                                                   const TokenAmount &amount) {
    if (amount < 0) {
      return FeeTokenError::kNegativeAmount;
    }
    OUTCOME_TRY(from_balance, balanceOf(from));
    if (from_balance < amount) {
      return FeeTokenError::kInsufficientBalance;
    }
    if (amount == 0 || from == to) {
      return outcome::success();
    }
    balances_[from] = from_balance - amount;
    balances_[to] += amount;
    return outcome::success();
  }

  outcome::result<void> InMemoryFeeToken::mint(const Account &to,
                                               const TokenAmount &amount) {
    if (amount < 0) {
      return FeeTokenError::kNegativeAmount;
    }
    balances_[to] += amount;
    return outcome::success();
  }

  TokenAmount InMemoryFeeToken::totalSupply() const {
    TokenAmount total;
    for (const auto &[holder, balance] : balances_) {
      total += balance;
    }
    return total;
  }
}  // namespace vefee::token
