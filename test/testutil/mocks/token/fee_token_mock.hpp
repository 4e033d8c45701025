/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "token/fee_token.hpp"

namespace vefee::token {
  class FeeTokenMock : public FeeToken {
   public:
    MOCK_CONST_METHOD1(balanceOf,
                       outcome::result<TokenAmount>(const Account &));
    MOCK_METHOD3(transfer,
                 outcome::result<void>(const Account &,
                                       const Account &,
                                       const TokenAmount &));
  };
}  // namespace vefee::token
