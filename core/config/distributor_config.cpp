/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/distributor_config.hpp"

namespace vefee::config {
  outcome::result<DistributorConfig> loadDistributorConfig(
      const Config &config) {
    DistributorConfig result;
    OUTCOME_TRY(start_time, config.get<int64_t>("distributor.start_time"));
    OUTCOME_TRY(admin, config.get<std::string>("distributor.admin"));
    OUTCOME_TRY(address,
                config.get<std::string>("distributor.address",
                                        kDefaultDistributorAddress));
    OUTCOME_TRY(cooldown,
                config.get<int64_t>("distributor.checkpoint_cooldown",
                                    result.checkpoint_cooldown.count()));
    OUTCOME_TRY(
        can_checkpoint_token,
        config.get<bool>("distributor.can_checkpoint_token", false));

    if (start_time < 0 || cooldown < 0 || admin.empty() || address.empty()) {
      return ConfigError::kInvalidValue;
    }
    result.address = address;
    result.admin = admin;
    result.start_time = UnixTime{start_time};
    result.checkpoint_cooldown = UnixTime{cooldown};
    result.can_checkpoint_token = can_checkpoint_token;
    return result;
  }
}  // namespace vefee::config
