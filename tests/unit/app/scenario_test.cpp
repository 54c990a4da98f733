/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/scenario.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

using taiko::app::parseScenario;
using taiko::app::ProposeStep;
using taiko::app::ProveStep;
using taiko::app::ScenarioError;
using taiko::app::VerifyStep;

TEST(ScenarioTest, Steps) {
  auto root = YAML::Load(R"yaml(
steps:
  - propose:
      id: 1
      l1-height: 10
      l1-hash: "0x1111111111111111111111111111111111111111111111111111111111111111"
      gas-limit: 5000000
      extra-data: "0x4242"
  - prove:
      id: 1
      prover: "0x9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e01"
      parent-hash: "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
      circuit: 3
      anchor-tx: "0x02f0"
      expect: accepted
  - prove-invalid:
      id: 1
      prover: "0x9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e9e02"
      parent-hash: "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
      expect: rejected
  - verify: {id: 1}
)yaml");
  ASSERT_OUTCOME_SUCCESS(scenario, parseScenario(root));
  ASSERT_EQ(scenario.steps.size(), 4);

  auto &propose = std::get<ProposeStep>(scenario.steps[0]);
  EXPECT_EQ(propose.meta.id, 1);
  EXPECT_EQ(propose.meta.l1_height, 10);
  EXPECT_EQ(propose.meta.l1_hash[31], 0x11);
  EXPECT_EQ(propose.meta.gas_limit, 5'000'000);
  EXPECT_EQ(propose.meta.extra_data.size(), 2);

  auto &prove = std::get<ProveStep>(scenario.steps[1]);
  EXPECT_FALSE(prove.invalid);
  EXPECT_EQ(prove.prover[19], 0x01);
  EXPECT_EQ(prove.circuit, 3);
  EXPECT_EQ(prove.anchor_tx, (qtils::ByteVec{0x02, 0xf0}));
  EXPECT_EQ(prove.expect_accepted, true);

  auto &invalid = std::get<ProveStep>(scenario.steps[2]);
  EXPECT_TRUE(invalid.invalid);
  EXPECT_EQ(invalid.expect_accepted, false);
  EXPECT_TRUE(invalid.receipt.empty());

  EXPECT_EQ(std::get<VerifyStep>(scenario.steps[3]).id, 1);
}

TEST(ScenarioTest, Malformed) {
  ASSERT_OUTCOME_ERROR(parseScenario(YAML::Load("[1, 2]")),
                       ScenarioError::NO_STEPS);
  ASSERT_OUTCOME_ERROR(parseScenario(YAML::Load("steps: {}")),
                       ScenarioError::NO_STEPS);
  ASSERT_OUTCOME_ERROR(
      parseScenario(YAML::Load("steps: [{finalize: {id: 1}}]")),
      ScenarioError::UNKNOWN_STEP);
  ASSERT_OUTCOME_ERROR(parseScenario(YAML::Load("steps: [{verify: {}}]")),
                       ScenarioError::MISSING_FIELD);
  ASSERT_OUTCOME_ERROR(
      parseScenario(YAML::Load("steps: [{verify: {id: twelve}}]")),
      ScenarioError::INVALID_FIELD);
  ASSERT_OUTCOME_ERROR(
      parseScenario(YAML::Load("steps: [{prove: {id: 1, prover: 0x01, "
                               "parent-hash: 0x00}}]")),
      ScenarioError::INVALID_FIELD);
}
