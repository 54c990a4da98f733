/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/types.hpp"

namespace taiko::crypto {

  struct AnchorSignature {
    Hash256 r;
    Hash256 s;

    bool operator==(const AnchorSignature &) const = default;
  };

  /// x coordinate of 1*G on secp256k1, `r` of an anchor signed with k = 1
  inline const Hash256 kGoldenTouchGX =
      Hash256::fromHex(
          "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798")
          .value();

  /// x coordinate of 2*G on secp256k1, `r` of an anchor signed with k = 2
  inline const Hash256 kGoldenTouchGX2 =
      Hash256::fromHex(
          "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5")
          .value();

  /**
   * Deterministic signer of anchor transactions. The golden touch key is
   * public, and the nonce `k` is fixed to 1 or 2, so anybody can reproduce
   * the signature a block builder had to produce.
   */
  class AnchorSigner {
   public:
    enum class Error {
      INVALID_K,
      OPENSSL_FAILURE,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::INVALID_K:
          return "Anchor signature nonce must be 1 or 2";
        case E::OPENSSL_FAILURE:
          return "OpenSSL failed to compute anchor signature";
      }
      abort();
    }

    virtual ~AnchorSigner() = default;

    /**
     * Sign `digest` with the golden touch key using nonce `k`.
     * @param digest hash of the unsigned anchor transaction
     * @param k nonce, 1 or 2
     */
    virtual outcome::result<AnchorSignature> signDigest(const Hash256 &digest,
                                                        uint8_t k) const = 0;
  };

}  // namespace taiko::crypto
