/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "primitives/big_int.hpp"

namespace vefee::primitives {
  /// Opaque identifier of a token holder or voting-escrow locker
  using Account = std::string;

  using TokenAmount = BigInt;
}  // namespace vefee::primitives
