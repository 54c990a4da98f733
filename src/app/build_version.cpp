/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef TAIKO_BUILD_VERSION
#define TAIKO_BUILD_VERSION "undefined"
#endif

namespace taiko {
  const std::string &buildVersion() {
    static const std::string version{TAIKO_BUILD_VERSION};
    return version;
  }
}  // namespace taiko
