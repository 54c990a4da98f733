/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "resolver/impl/address_manager.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "mock/app/configuration_mock.hpp"
#include "testutil/prepare_loggers.hpp"

using taiko::Address;
using taiko::kZeroAddress;
using taiko::app::Configuration;
using taiko::app::ConfigurationMock;
using taiko::resolver::AddressManager;
using taiko::resolver::AddressResolver;
using testing::ReturnRef;

class AddressManagerTest : public testing::Test {
 protected:
  void SetUp() override {
    taiko_.fill(0x01);
    oracle_.fill(0x02);
    addresses_ = {
        {"167.taiko", taiko_},
        {"31336.oracle_prover", oracle_},
    };
    config_ = std::make_shared<ConfigurationMock>();
    EXPECT_CALL(*config_, addresses()).WillRepeatedly(ReturnRef(addresses_));
    manager_ =
        std::make_shared<AddressManager>(testutil::prepareLoggers(), config_);
  }

  Address taiko_;
  Address oracle_;
  Configuration::Addresses addresses_;
  std::shared_ptr<ConfigurationMock> config_;
  std::shared_ptr<AddressManager> manager_;
};

TEST_F(AddressManagerTest, ResolveFromConfiguration) {
  ASSERT_OUTCOME_SUCCESS(taiko, manager_->resolve(167, "taiko", false));
  EXPECT_EQ(taiko, taiko_);
  ASSERT_OUTCOME_SUCCESS(oracle,
                         manager_->resolve(31336, "oracle_prover", false));
  EXPECT_EQ(oracle, oracle_);
}

/**
 * @given address registered for chain 167
 * @when resolving same name on another chain
 * @then it is missing
 */
TEST_F(AddressManagerTest, NamespacedByChain) {
  ASSERT_OUTCOME_ERROR(manager_->resolve(1, "taiko", false),
                       AddressResolver::Error::MISSING_ADDRESS);
  ASSERT_OUTCOME_SUCCESS(zero, manager_->resolve(1, "taiko", true));
  EXPECT_EQ(zero, kZeroAddress);
}

TEST_F(AddressManagerTest, SetAndRemove) {
  Address verifier;
  verifier.fill(0x03);
  manager_->setAddress(167, "proof_verifier", verifier);
  ASSERT_OUTCOME_SUCCESS(resolved,
                         manager_->resolve(167, "proof_verifier", false));
  EXPECT_EQ(resolved, verifier);

  manager_->setAddress(167, "proof_verifier", kZeroAddress);
  ASSERT_OUTCOME_ERROR(manager_->resolve(167, "proof_verifier", false),
                       AddressResolver::Error::MISSING_ADDRESS);
}

TEST(AddressManagerKeyTest, Format) {
  EXPECT_EQ(AddressManager::key(167, "taiko"), "167.taiko");
}
