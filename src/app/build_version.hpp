/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace taiko {
  /**
   * @returns String indicating current build version. Might be a tag, a
   * commit hash or the project version.
   */
  const std::string &buildVersion();
}  // namespace taiko
