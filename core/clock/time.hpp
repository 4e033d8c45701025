/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

namespace vefee::clock {
  using UnixTime = std::chrono::seconds;

  /// ISO-8601 UTC representation, e.g. 2021-01-07T00:00:00Z
  std::string unixTimeToString(UnixTime);
}  // namespace vefee::clock
