/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

namespace vefee::clock {
  const static boost::posix_time::ptime kPtimeUnixZero(
      boost::gregorian::date(1970, 1, 1));

  std::string unixTimeToString(UnixTime time) {
    return boost::posix_time::to_iso_extended_string(
               kPtimeUnixZero + boost::posix_time::seconds{time.count()})
           + "Z";
  }
}  // namespace vefee::clock
