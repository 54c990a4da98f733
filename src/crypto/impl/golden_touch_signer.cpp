/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/impl/golden_touch_signer.hpp"

#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace taiko::crypto {

  namespace {
    struct BnDeleter {
      void operator()(BIGNUM *bn) const {
        BN_free(bn);
      }
    };
    struct BnCtxDeleter {
      void operator()(BN_CTX *ctx) const {
        BN_CTX_free(ctx);
      }
    };
    struct EcGroupDeleter {
      void operator()(EC_GROUP *group) const {
        EC_GROUP_free(group);
      }
    };
    struct EcPointDeleter {
      void operator()(EC_POINT *point) const {
        EC_POINT_free(point);
      }
    };
    using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
    using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
    using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;

    BnPtr fromBytes(const Hash256 &bytes) {
      return BnPtr{BN_bin2bn(bytes.data(), bytes.size(), nullptr)};
    }

    bool toBytes(const BIGNUM *bn, Hash256 &out) {
      return BN_bn2binpad(bn, out.data(), static_cast<int>(out.size()))
          == static_cast<int>(out.size());
    }
  }  // namespace

  const Hash256 &GoldenTouchSigner::privateKey() {
    static const Hash256 key =
        Hash256::fromHex(
            "92954368afd3caa1f3ce3ead0069c1af414054aefe1ef9aeacc1bf426222ce38")
            .value();
    return key;
  }

  outcome::result<AnchorSignature> GoldenTouchSigner::signDigest(
      const Hash256 &digest, uint8_t k) const {
    if (k != 1 and k != 2) {
      return Error::INVALID_K;
    }

    BnCtxPtr ctx{BN_CTX_new()};
    EcGroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    if (not ctx or not group) {
      return Error::OPENSSL_FAILURE;
    }
    const BIGNUM *order = EC_GROUP_get0_order(group.get());

    BnPtr nonce{BN_new()};
    EcPointPtr point{EC_POINT_new(group.get())};
    BnPtr x{BN_new()};
    BnPtr r{BN_new()};
    BnPtr rd{BN_new()};
    BnPtr sum{BN_new()};
    BnPtr s{BN_new()};
    auto z = fromBytes(digest);
    auto d = fromBytes(privateKey());
    if (not nonce or not point or not x or not r or not rd or not sum or not s
        or not z or not d) {
      return Error::OPENSSL_FAILURE;
    }

    if (not BN_set_word(nonce.get(), k)
        or not EC_POINT_mul(group.get(),
                            point.get(),
                            nonce.get(),
                            nullptr,
                            nullptr,
                            ctx.get())
        or not EC_POINT_get_affine_coordinates(
            group.get(), point.get(), x.get(), nullptr, ctx.get())
        or not BN_nnmod(r.get(), x.get(), order, ctx.get())
        or not BN_mod_mul(rd.get(), r.get(), d.get(), order, ctx.get())
        or not BN_mod_add(sum.get(), z.get(), rd.get(), order, ctx.get())) {
      return Error::OPENSSL_FAILURE;
    }
    BnPtr nonce_inv{BN_mod_inverse(nullptr, nonce.get(), order, ctx.get())};
    if (not nonce_inv
        or not BN_mod_mul(
            s.get(), nonce_inv.get(), sum.get(), order, ctx.get())) {
      return Error::OPENSSL_FAILURE;
    }

    AnchorSignature signature;
    if (not toBytes(r.get(), signature.r) or not toBytes(s.get(), signature.s)) {
      return Error::OPENSSL_FAILURE;
    }
    return signature;
  }

}  // namespace taiko::crypto
