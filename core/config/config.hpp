/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_VEFEE_CORE_CONFIG_CONFIG_HPP
#define CPP_VEFEE_CORE_CONFIG_CONFIG_HPP

#include <istream>
#include <string>

#include <boost/property_tree/ptree.hpp>

#include "common/outcome.hpp"
#include "config/config_error.hpp"

namespace vefee::config {

  /** @brief Configuration key, dot separated path */
  using ConfigKey = std::string;

  /**
   * @brief Key-value configuration backed by JSON document
   */
  class Config {
   public:
    /**
     * @brief Save config to file
     * @param filename - path to a file to store config
     * @return nothing or error occurred
     */
    outcome::result<void> save(const std::string &filename) const;

    /**
     * @brief Load config from file
     * @param filename - path to a file with config
     * @return nothing or error occurred
     */
    outcome::result<void> load(const std::string &filename);

    /**
     * @brief Load config from JSON text stream
     */
    outcome::result<void> load(std::istream &input);

    template <typename T>
    void set(const ConfigKey &key, const T &value) {
      ptree_.put<T>(key, value);
    }

    /**
     * Get config value by key
     * @tparam T - expected parameter of a configuration value
     * @param key - configuration key
     * @return value or error occurred
     */
    template <typename T>
    outcome::result<T> get(const ConfigKey &key) const {
      try {
        return ptree_.get<T>(key);
      } catch (const boost::property_tree::ptree_bad_path &) {
        return outcome::failure(ConfigError::kBadPath);
      } catch (const boost::property_tree::ptree_bad_data &) {
        return outcome::failure(ConfigError::kInvalidValue);
      }
    }

    /**
     * Get config value by key, missing key gives default value
     */
    template <typename T>
    outcome::result<T> get(const ConfigKey &key, const T &default_value) const {
      if (!ptree_.get_child_optional(key)) {
        return default_value;
      }
      return get<T>(key);
    }

   private:
    boost::property_tree::ptree ptree_;
  };

}  // namespace vefee::config

#endif  // CPP_VEFEE_CORE_CONFIG_CONFIG_HPP
