/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <qtils/byte_vec.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "types/block_metadata.hpp"

namespace taiko::app {

  /// Record a new proposed block
  struct ProposeStep {
    BlockMetadata meta;
  };

  /// Advance latest verified block id
  struct VerifyStep {
    BlockId id = 0;
  };

  /**
   * Submit a proof. Evidence metadata is the one proposed for `id`, the
   * header is derived from it.
   */
  struct ProveStep {
    BlockId id = 0;
    bool invalid = false;
    ProverId prover;
    BlockHash parent_hash;
    Hash256 state_root;
    Hash256 transactions_root;
    Hash256 receipts_root;
    uint64_t gas_used = 0;
    uint16_t circuit = 0;
    /// Anchor tx for a valid block, target metadata is taken from proposal
    qtils::ByteVec anchor_tx;
    /// Anchor receipt or invalidate receipt
    qtils::ByteVec receipt;
    /// Expected outcome, none if any is fine
    std::optional<bool> expect_accepted;
  };

  using ScenarioStep = std::variant<ProposeStep, VerifyStep, ProveStep>;

  struct Scenario {
    std::vector<ScenarioStep> steps;
  };

  enum class ScenarioError {
    NO_STEPS,
    UNKNOWN_STEP,
    MISSING_FIELD,
    INVALID_FIELD,
  };
  Q_ENUM_ERROR_CODE(ScenarioError) {
    using E = decltype(e);
    switch (e) {
      case E::NO_STEPS:
        return "Scenario has no 'steps' list";
      case E::UNKNOWN_STEP:
        return "Unknown scenario step";
      case E::MISSING_FIELD:
        return "Scenario step misses a required field";
      case E::INVALID_FIELD:
        return "Scenario step has invalid field value";
    }
    abort();
  }

  /**
   * Parse scenario:
   * ```
   * steps:
   *   - propose: {id: 1, l1-height: 10, l1-hash: 0x.., gas-limit: ..}
   *   - prove: {id: 1, prover: 0x.., parent-hash: 0x.., expect: accepted}
   *   - prove-invalid: {id: 1, prover: 0x.., receipt: 0x..}
   *   - verify: {id: 1}
   * ```
   */
  outcome::result<Scenario> parseScenario(const YAML::Node &root);

}  // namespace taiko::app
