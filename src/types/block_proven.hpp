/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "types/types.hpp"

namespace taiko {

  /**
   * Event emitted every time a proof is admitted into a fork choice.
   */
  struct BlockProven {
    BlockId id = 0;
    BlockHash parent_hash;
    BlockHash block_hash;
    /// Timestamp declared by the block metadata
    TimestampSeconds timestamp = 0;
    TimestampSeconds proven_at = 0;
    ProverId prover;

    bool operator==(const BlockProven &) const = default;
  };

}  // namespace taiko

template <>
struct fmt::formatter<taiko::BlockProven> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const taiko::BlockProven &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "BlockProven(id={}, parent={:0x}, hash={:0x}, "
                          "timestamp={}, proven_at={}, prover={:0xx})",
                          v.id,
                          v.parent_hash,
                          v.block_hash,
                          v.timestamp,
                          v.proven_at,
                          v.prover);
  }
};
