/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/scenario.hpp"

#include <string_view>

#include <qtils/unhex.hpp>

namespace taiko::app {
  namespace {
    outcome::result<YAML::Node> field(const YAML::Node &step,
                                      const char *key,
                                      bool required) {
      auto node = step[key];
      if (not node.IsDefined()) {
        if (required) {
          return ScenarioError::MISSING_FIELD;
        }
        return YAML::Node{};
      }
      if (not node.IsScalar()) {
        return ScenarioError::INVALID_FIELD;
      }
      return node;
    }

    template <typename T>
    outcome::result<void> readUint(const YAML::Node &step,
                                   const char *key,
                                   T &out,
                                   bool required = false) {
      OUTCOME_TRY(node, field(step, key, required));
      if (not node.IsDefined()) {
        return outcome::success();
      }
      try {
        out = node.as<T>();
      } catch (const YAML::Exception &) {
        return ScenarioError::INVALID_FIELD;
      }
      return outcome::success();
    }

    template <size_t N>
    outcome::result<void> readHash(const YAML::Node &step,
                                   const char *key,
                                   qtils::ByteArr<N> &out,
                                   bool required = false) {
      OUTCOME_TRY(node, field(step, key, required));
      if (not node.IsDefined()) {
        return outcome::success();
      }
      auto hash = qtils::ByteArr<N>::fromHexWithPrefix(node.Scalar());
      if (not hash.has_value()) {
        return ScenarioError::INVALID_FIELD;
      }
      out = hash.value();
      return outcome::success();
    }

    outcome::result<void> readBytes(const YAML::Node &step,
                                    const char *key,
                                    qtils::ByteVec &out) {
      OUTCOME_TRY(node, field(step, key, false));
      if (not node.IsDefined()) {
        return outcome::success();
      }
      if (not qtils::unhex0x(out, node.Scalar(), true).has_value()) {
        return ScenarioError::INVALID_FIELD;
      }
      return outcome::success();
    }

    outcome::result<ScenarioStep> parsePropose(const YAML::Node &step) {
      ProposeStep propose;
      auto &meta = propose.meta;
      OUTCOME_TRY(readUint(step, "id", meta.id, true));
      OUTCOME_TRY(readUint(step, "l1-height", meta.l1_height));
      OUTCOME_TRY(readHash(step, "l1-hash", meta.l1_hash));
      OUTCOME_TRY(readHash(step, "beneficiary", meta.beneficiary));
      OUTCOME_TRY(readHash(step, "tx-list-hash", meta.tx_list_hash));
      OUTCOME_TRY(readHash(step, "mix-hash", meta.mix_hash));
      OUTCOME_TRY(readUint(step, "gas-limit", meta.gas_limit));
      OUTCOME_TRY(readUint(step, "timestamp", meta.timestamp));
      OUTCOME_TRY(readUint(step, "commit-height", meta.commit_height));
      OUTCOME_TRY(readUint(step, "commit-slot", meta.commit_slot));
      qtils::ByteVec extra_data;
      OUTCOME_TRY(readBytes(step, "extra-data", extra_data));
      if (extra_data.size() > MAX_EXTRA_DATA_SIZE) {
        return ScenarioError::INVALID_FIELD;
      }
      meta.extra_data.data().assign(extra_data.begin(), extra_data.end());
      return propose;
    }

    outcome::result<ScenarioStep> parseProve(const YAML::Node &step,
                                             bool invalid) {
      ProveStep prove;
      prove.invalid = invalid;
      OUTCOME_TRY(readUint(step, "id", prove.id, true));
      OUTCOME_TRY(readHash(step, "prover", prove.prover, true));
      OUTCOME_TRY(readHash(step, "parent-hash", prove.parent_hash, true));
      OUTCOME_TRY(readHash(step, "state-root", prove.state_root));
      OUTCOME_TRY(
          readHash(step, "transactions-root", prove.transactions_root));
      OUTCOME_TRY(readHash(step, "receipts-root", prove.receipts_root));
      OUTCOME_TRY(readUint(step, "gas-used", prove.gas_used));
      OUTCOME_TRY(readUint(step, "circuit", prove.circuit));
      OUTCOME_TRY(readBytes(step, "anchor-tx", prove.anchor_tx));
      OUTCOME_TRY(readBytes(step, "receipt", prove.receipt));
      OUTCOME_TRY(expect, field(step, "expect", false));
      if (expect.IsDefined()) {
        std::string_view value = expect.Scalar();
        if (value == "accepted") {
          prove.expect_accepted = true;
        } else if (value == "rejected") {
          prove.expect_accepted = false;
        } else {
          return ScenarioError::INVALID_FIELD;
        }
      }
      return prove;
    }
  }  // namespace

  outcome::result<Scenario> parseScenario(const YAML::Node &root) {
    if (not root.IsMap()) {
      return ScenarioError::NO_STEPS;
    }
    auto steps = root["steps"];
    if (not steps.IsDefined() or not steps.IsSequence()) {
      return ScenarioError::NO_STEPS;
    }
    Scenario scenario;
    for (const auto &entry : steps) {
      if (not entry.IsMap() or entry.size() != 1) {
        return ScenarioError::UNKNOWN_STEP;
      }
      auto it = entry.begin();
      auto kind = it->first.as<std::string>();
      const auto &body = it->second;
      if (not body.IsMap()) {
        return ScenarioError::INVALID_FIELD;
      }
      if (kind == "propose") {
        OUTCOME_TRY(step, parsePropose(body));
        scenario.steps.emplace_back(std::move(step));
      } else if (kind == "verify") {
        VerifyStep verify;
        OUTCOME_TRY(readUint(body, "id", verify.id, true));
        scenario.steps.emplace_back(verify);
      } else if (kind == "prove" or kind == "prove-invalid") {
        OUTCOME_TRY(step, parseProve(body, kind == "prove-invalid"));
        scenario.steps.emplace_back(std::move(step));
      } else {
        return ScenarioError::UNKNOWN_STEP;
      }
    }
    return scenario;
  }

}  // namespace taiko::app
