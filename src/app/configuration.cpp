/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace taiko::app {

  Configuration::Configuration() : version_("undefined"), name_("unnamed") {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::optional<std::filesystem::path> &Configuration::scenarioFile()
      const {
    return scenario_file_;
  }

  const ProtocolConfig &Configuration::protocol() const {
    return protocol_;
  }

  const Configuration::Addresses &Configuration::addresses() const {
    return addresses_;
  }

}  // namespace taiko::app
