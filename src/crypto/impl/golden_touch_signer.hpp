/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/anchor_signer.hpp"

namespace taiko::crypto {

  /**
   * secp256k1 ECDSA over the golden touch key, computed with OpenSSL
   * big numbers: r = (k*G).x mod n, s = k^-1 * (digest + r * key) mod n.
   */
  class GoldenTouchSigner : public AnchorSigner {
   public:
    // AnchorSigner
    outcome::result<AnchorSignature> signDigest(const Hash256 &digest,
                                                uint8_t k) const override;

    static const Hash256 &privateKey();
  };

}  // namespace taiko::crypto
