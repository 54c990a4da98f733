/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/types.hpp"

namespace taiko::resolver {

  /// L2 protocol contract, destination of anchor transactions
  constexpr std::string_view kTaikoName = "taiko";
  /// Privileged prover allowed to skip zk verification
  constexpr std::string_view kOracleProverName = "oracle_prover";
  constexpr std::string_view kProofVerifierName = "proof_verifier";

  /**
   * Name to address resolution, namespaced by chain id.
   */
  class AddressResolver {
   public:
    enum class Error {
      MISSING_ADDRESS,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::MISSING_ADDRESS:
          return "Address is not registered";
      }
      abort();
    }

    virtual ~AddressResolver() = default;

    /**
     * @param allow_zero return zero address instead of failing when no
     * address is registered
     */
    virtual outcome::result<Address> resolve(ChainId chain_id,
                                             std::string_view name,
                                             bool allow_zero) const = 0;
  };

}  // namespace taiko::resolver
