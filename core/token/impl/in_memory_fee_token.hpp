/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "token/fee_token.hpp"

namespace vefee::token {
  /**
   * Fee token ledger kept in memory. Mostly needed for tests and simulations
   * where no external token is available.
   */
  class InMemoryFeeToken : public FeeToken {
   public:
    outcome::result<TokenAmount> balanceOf(
        const Account &holder) const override;

    outcome::result<void> transfer(const Account &from,
                                   const Account &to,
                                   const TokenAmount &amount) override;

    /**
     * Creates new tokens out of thin air
     * @param to - receiver of minted tokens
     * @param amount - non-negative amount
     */
    outcome::result<void> mint(const Account &to, const TokenAmount &amount);

    TokenAmount totalSupply() const;

   private:
    std::map<Account, TokenAmount> balances_;
  };
}  // namespace vefee::token
