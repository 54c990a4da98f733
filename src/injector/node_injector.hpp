/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace taiko::log {
  class LoggingSystem;
}  // namespace taiko::log

namespace taiko::app {
  class Configuration;
  class Application;
}  // namespace taiko::app

namespace taiko::injector {

  /**
   * Dependency injector of the node. Provides all components required by
   * the taiko-finality application.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::Application> injectApplication();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace taiko::injector
