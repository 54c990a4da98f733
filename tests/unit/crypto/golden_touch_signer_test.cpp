/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/impl/golden_touch_signer.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

using taiko::Hash256;
using taiko::crypto::AnchorSigner;
using taiko::crypto::GoldenTouchSigner;
using taiko::crypto::kGoldenTouchGX;
using taiko::crypto::kGoldenTouchGX2;

Hash256 fromHex(std::string_view hex) {
  return Hash256::fromHex(hex).value();
}

/**
 * @given golden touch signer
 * @when signing with k = 1 and k = 2
 * @then r is x coordinate of G and 2G
 */
TEST(GoldenTouchSignerTest, RIsNonceMultipleOfGenerator) {
  GoldenTouchSigner signer;
  Hash256 digest;
  ASSERT_OUTCOME_SUCCESS(sig1, signer.signDigest(digest, 1));
  EXPECT_EQ(sig1.r, kGoldenTouchGX);
  ASSERT_OUTCOME_SUCCESS(sig2, signer.signDigest(digest, 2));
  EXPECT_EQ(sig2.r, kGoldenTouchGX2);
}

TEST(GoldenTouchSignerTest, SForZeroDigest) {
  GoldenTouchSigner signer;
  ASSERT_OUTCOME_SUCCESS(sig1, signer.signDigest(Hash256{}, 1));
  EXPECT_EQ(sig1.s,
            fromHex("4341adf5a780b4a87939938fd7a032f6e6664c7da553c121d3b494742"
                    "9639122"));
  ASSERT_OUTCOME_SUCCESS(sig2, signer.signDigest(Hash256{}, 2));
  EXPECT_EQ(sig2.s,
            fromHex("2521d8c9653a6559006b60436fc87db94d5e54f2969c5c7d05f5a757f"
                    "384ab6f"));
}

/**
 * @given digest equal to -r*key mod n
 * @when signing with k = 1
 * @then s is zero, the builder has to fall back to k = 2
 */
TEST(GoldenTouchSignerTest, ZeroS) {
  GoldenTouchSigner signer;
  auto digest = fromHex(
      "bcbe520a587f4b5786c66c70285fcd07d448906909f4df19ec1dca18a6d2b01f");
  ASSERT_OUTCOME_SUCCESS(sig, signer.signDigest(digest, 1));
  EXPECT_EQ(sig.s, Hash256{});
}

TEST(GoldenTouchSignerTest, OnlyNonceOneOrTwo) {
  GoldenTouchSigner signer;
  ASSERT_OUTCOME_ERROR(signer.signDigest(Hash256{}, 0),
                       AnchorSigner::Error::INVALID_K);
  ASSERT_OUTCOME_ERROR(signer.signDigest(Hash256{}, 3),
                       AnchorSigner::Error::INVALID_K);
}
