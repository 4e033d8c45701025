/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "distributor/state_codec.hpp"

#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(vefee::distributor, StateCodecError, e) {
  using vefee::distributor::StateCodecError;
  switch (e) {
    case StateCodecError::kCannotOpenFile:
      return "StateCodecError: cannot open file";
    case StateCodecError::kJSONParserError:
      return "StateCodecError: JSON parser error";
    case StateCodecError::kMissingField:
      return "StateCodecError: required field is missing or malformed";
    case StateCodecError::kInvalidAmount:
      return "StateCodecError: amount is not a non-negative integer";
    case StateCodecError::kInvalidEpoch:
      return "StateCodecError: epoch is not aligned";
    case StateCodecError::kDuplicateEntry:
      return "StateCodecError: epoch or account appears twice";
    default:
      return "StateCodecError: unknown error";
  }
}

namespace vefee::distributor {
  using boost::property_tree::ptree;

  namespace {
    ptree encodeLedger(const EpochLedger &ledger) {
      ptree entries;
      for (const auto &[epoch, amount] : ledger.entries()) {
        ptree entry;
        entry.put("epoch", epoch.count());
        entry.put("amount", amount.str());
        entries.push_back(std::make_pair("", entry));
      }
      return entries;
    }

    template <typename T>
    outcome::result<T> field(const ptree &tree, const std::string &key) {
      auto value = tree.get_optional<T>(key);
      if (!value) {
        return outcome::failure(StateCodecError::kMissingField);
      }
      return *value;
    }

    outcome::result<UnixTime> timeField(const ptree &tree,
                                        const std::string &key) {
      OUTCOME_TRY(seconds, field<int64_t>(tree, key));
      return UnixTime{seconds};
    }

    outcome::result<UnixTime> epochField(const ptree &tree,
                                         const std::string &key) {
      OUTCOME_TRY(epoch, timeField(tree, key));
      if (epoch.count() < 0 || !clock::isEpochAligned(epoch)) {
        return outcome::failure(StateCodecError::kInvalidEpoch);
      }
      return epoch;
    }

    outcome::result<TokenAmount> amountField(const ptree &tree,
                                             const std::string &key) {
      OUTCOME_TRY(text, field<std::string>(tree, key));
      TokenAmount amount;
      try {
        amount = TokenAmount{text};
      } catch (const std::runtime_error &) {
        return outcome::failure(StateCodecError::kInvalidAmount);
      }
      if (text.empty() || amount < 0) {
        return outcome::failure(StateCodecError::kInvalidAmount);
      }
      return amount;
    }

    outcome::result<EpochLedger> decodeLedger(const ptree &tree,
                                              const std::string &key) {
      auto entries = tree.get_child_optional(key);
      if (!entries) {
        return outcome::failure(StateCodecError::kMissingField);
      }
      EpochLedger::Entries result;
      for (const auto &child : *entries) {
        OUTCOME_TRY(epoch, epochField(child.second, "epoch"));
        OUTCOME_TRY(amount, amountField(child.second, "amount"));
        if (!result.emplace(epoch, std::move(amount)).second) {
          return outcome::failure(StateCodecError::kDuplicateEntry);
        }
      }
      return EpochLedger{std::move(result)};
    }
  }  // namespace

  ptree encodeState(const DistributorState &state) {
    ptree tree;
    tree.put("address", state.address);
    tree.put("start_time", state.start_time.count());

    tree.put("admin.admin", state.admin.admin());
    if (state.admin.futureAdmin()) {
      tree.put("admin.future_admin", *state.admin.futureAdmin());
    }
    tree.put("admin.can_checkpoint_token", state.admin.canCheckpointToken());
    tree.put("admin.checkpoint_cooldown",
             state.admin.checkpointCooldown().count());

    tree.put("tokens.last_token_time", state.tokens.lastTokenTime().count());
    tree.put("tokens.token_last_balance",
             state.tokens.tokenLastBalance().str());
    tree.add_child("tokens.per_epoch", encodeLedger(state.tokens.ledger()));

    tree.put("supply.time_cursor", state.supply.timeCursor().count());
    tree.add_child("supply.per_epoch", encodeLedger(state.supply.ledger()));

    ptree cursors;
    for (const auto &[account, cursor] : state.claims.cursors()) {
      ptree entry;
      entry.put("account", account);
      entry.put("time_cursor", cursor.count());
      cursors.push_back(std::make_pair("", entry));
    }
    tree.add_child("claims", cursors);
    return tree;
  }

  outcome::result<DistributorState> decodeState(const ptree &tree) {
    OUTCOME_TRY(address, field<std::string>(tree, "address"));
    OUTCOME_TRY(start_time, epochField(tree, "start_time"));

    OUTCOME_TRY(admin, field<std::string>(tree, "admin.admin"));
    auto future_admin = tree.get_optional<std::string>("admin.future_admin");
    OUTCOME_TRY(can_checkpoint_token,
                field<bool>(tree, "admin.can_checkpoint_token"));
    OUTCOME_TRY(cooldown, timeField(tree, "admin.checkpoint_cooldown"));

    OUTCOME_TRY(last_token_time, timeField(tree, "tokens.last_token_time"));
    OUTCOME_TRY(token_last_balance,
                amountField(tree, "tokens.token_last_balance"));
    OUTCOME_TRY(tokens_ledger, decodeLedger(tree, "tokens.per_epoch"));

    OUTCOME_TRY(time_cursor, epochField(tree, "supply.time_cursor"));
    OUTCOME_TRY(supply_ledger, decodeLedger(tree, "supply.per_epoch"));

    auto cursors_tree = tree.get_child_optional("claims");
    if (!cursors_tree) {
      return outcome::failure(StateCodecError::kMissingField);
    }
    ClaimEngine::Cursors cursors;
    for (const auto &child : *cursors_tree) {
      OUTCOME_TRY(account, field<std::string>(child.second, "account"));
      OUTCOME_TRY(cursor, epochField(child.second, "time_cursor"));
      if (!cursors.emplace(account, cursor).second) {
        return outcome::failure(StateCodecError::kDuplicateEntry);
      }
    }

    return DistributorState{
        address,
        start_time,
        AdminGate{admin, future_admin, can_checkpoint_token, cooldown},
        TokenCheckpointer{
            last_token_time, token_last_balance, std::move(tokens_ledger)},
        SupplyCheckpointer{time_cursor, std::move(supply_ledger)},
        ClaimEngine{start_time, std::move(cursors)},
    };
  }

  outcome::result<void> saveState(const DistributorState &state,
                                  const std::string &filename) {
    try {
      boost::property_tree::write_json(filename, encodeState(state));
    } catch (const boost::property_tree::file_parser_error &) {
      return outcome::failure(StateCodecError::kCannotOpenFile);
    }
    return outcome::success();
  }

  outcome::result<DistributorState> loadState(const std::string &filename) {
    if (!boost::filesystem::exists(filename)) {
      return outcome::failure(StateCodecError::kCannotOpenFile);
    }
    ptree tree;
    try {
      boost::property_tree::read_json(filename, tree);
    } catch (const boost::property_tree::json_parser::json_parser_error &) {
      return outcome::failure(StateCodecError::kJSONParserError);
    }
    return decodeState(tree);
  }
}  // namespace vefee::distributor
