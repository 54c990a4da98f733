/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "types/protocol_config.hpp"
#include "types/types.hpp"
#include "utils/ctor_limiters.hpp"

namespace taiko::app {
  class Configuration : Singleton<Configuration> {
   public:
    /// "<chain id>.<name>" to address
    using Addresses = std::map<std::string, Address>;

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::optional<std::filesystem::path> &
    scenarioFile() const;

    [[nodiscard]] virtual const ProtocolConfig &protocol() const;

    [[nodiscard]] virtual const Addresses &addresses() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::optional<std::filesystem::path> scenario_file_;

    ProtocolConfig protocol_;
    Addresses addresses_;
  };

}  // namespace taiko::app
