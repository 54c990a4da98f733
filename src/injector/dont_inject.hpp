/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

// Constructed outside of the injector and bound as instance.
// A stray injection fails at link time with "unresolved symbol".
#define DONT_INJECT(T) explicit T(::taiko::injector::DontInjectHelper, ...);

namespace taiko::injector {
  struct DontInjectHelper {
    explicit DontInjectHelper() = default;
  };
}  // namespace taiko::injector
