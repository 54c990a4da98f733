/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace taiko {
  using Address = qtils::ByteArr<20>;

  constexpr Address kZeroAddress;
}  // namespace taiko
