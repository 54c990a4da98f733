/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "utils/ctor_limiters.hpp"

namespace taiko::app {

  /// @class Application - taiko-finality application interface
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Runs node, replaying configured scenario if any
    virtual outcome::result<void> run() = 0;
  };

}  // namespace taiko::app
