/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "resolver/address_resolver.hpp"

namespace taiko::app {
  class Configuration;
}  // namespace taiko::app

namespace taiko::resolver {

  /**
   * In-memory registry of named addresses, keyed by "<chain id>.<name>".
   * Initially filled from the `addresses` section of configuration.
   */
  class AddressManager : public AddressResolver {
   public:
    AddressManager(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> config);

    // AddressResolver
    outcome::result<Address> resolve(ChainId chain_id,
                                     std::string_view name,
                                     bool allow_zero) const override;

    /// Register or replace, zero address removes the record
    void setAddress(ChainId chain_id, std::string_view name, Address address);

    static std::string key(ChainId chain_id, std::string_view name);

   private:
    log::Logger logger_;
    std::map<std::string, Address, std::less<>> addresses_;
  };

}  // namespace taiko::resolver
