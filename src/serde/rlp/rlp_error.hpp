/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace taiko::rlp {
  enum class RlpError {
    INPUT_TOO_SHORT,
    INPUT_TOO_LONG,
    TYPE_UNEXPECTED,
    LEADING_ZERO,
    INTEGER_OVERFLOW,
    ARRAY_LENGTH_UNEXPECTED,
  };
  Q_ENUM_ERROR_CODE(RlpError) {
    using E = decltype(e);
    switch (e) {
      case E::INPUT_TOO_SHORT:
        return "RLP input too short";
      case E::INPUT_TOO_LONG:
        return "RLP input has trailing bytes";
      case E::TYPE_UNEXPECTED:
        return "RLP item is a list where a string was expected, or vice versa";
      case E::LEADING_ZERO:
        return "RLP integer has leading zero";
      case E::INTEGER_OVERFLOW:
        return "RLP integer does not fit";
      case E::ARRAY_LENGTH_UNEXPECTED:
        return "RLP string has unexpected length";
    }
    abort();
  }
}  // namespace taiko::rlp
