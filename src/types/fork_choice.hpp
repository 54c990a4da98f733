/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <functional>
#include <vector>

#include <fmt/format.h>

#include "types/types.hpp"

namespace taiko {

  /**
   * Fork choices are addressed by the proven block and the parent hash the
   * prover claims for it; provers may disagree on the parent.
   */
  struct ForkChoiceKey {
    BlockId block_id = 0;
    BlockHash parent_hash;

    bool operator==(const ForkChoiceKey &) const = default;
  };

  /**
   * @struct ForkChoice
   * Accepted result for a fork choice key and the provers vouching for it.
   */
  struct ForkChoice {
    BlockHash block_hash;
    /// Zero while the oracle prover waits for a second proof
    TimestampSeconds proven_at = 0;
    /// Distinct, in order of arrival
    std::vector<ProverId> provers;

    bool hasProver(const ProverId &prover) const {
      return std::ranges::find(provers, prover) != provers.end();
    }

    bool operator==(const ForkChoice &) const = default;
  };

}  // namespace taiko

template <>
struct std::hash<taiko::ForkChoiceKey> {
  size_t operator()(const taiko::ForkChoiceKey &key) const noexcept {
    auto seed = std::hash<taiko::BlockHash>{}(key.parent_hash);
    seed ^= std::hash<taiko::BlockId>{}(key.block_id) + 0x9e3779b9
          + (seed << 6) + (seed >> 2);
    return seed;
  }
};

template <>
struct fmt::formatter<taiko::ForkChoiceKey> {
  // Presentation format
  bool long_form = false;

  // Parses format specifications of the form ['s' | 'l'].
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end) {
      if (*it == 'l' or *it == 's') {
        long_form = *it == 'l';
        ++it;
      }
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const taiko::ForkChoiceKey &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    [[unlikely]] if (long_form) {
      return fmt::format_to(
          ctx.out(), "#{} (parent {:0xx})", v.block_id, v.parent_hash);
    }
    return fmt::format_to(
        ctx.out(), "#{} (parent {:0x})", v.block_id, v.parent_hash);
  }
};
