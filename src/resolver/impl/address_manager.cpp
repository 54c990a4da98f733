/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "resolver/impl/address_manager.hpp"

#include <fmt/format.h>

#include "app/configuration.hpp"

namespace taiko::resolver {

  AddressManager::AddressManager(qtils::SharedRef<log::LoggingSystem> logsys,
                                 qtils::SharedRef<app::Configuration> config)
      : logger_{logsys->getLogger("AddressManager", "taiko")},
        addresses_{config->addresses().begin(), config->addresses().end()} {
    for (auto &[key, address] : addresses_) {
      SL_DEBUG(logger_, "Address {} = {:0xx}", key, address);
    }
  }

  std::string AddressManager::key(ChainId chain_id, std::string_view name) {
    return fmt::format("{}.{}", chain_id, name);
  }

  outcome::result<Address> AddressManager::resolve(ChainId chain_id,
                                                   std::string_view name,
                                                   bool allow_zero) const {
    auto it = addresses_.find(key(chain_id, name));
    if (it != addresses_.end()) {
      return it->second;
    }
    if (allow_zero) {
      return kZeroAddress;
    }
    SL_DEBUG(logger_, "No address for {} on chain {}", name, chain_id);
    return Error::MISSING_ADDRESS;
  }

  void AddressManager::setAddress(ChainId chain_id,
                                  std::string_view name,
                                  Address address) {
    auto record = key(chain_id, name);
    if (address == kZeroAddress) {
      addresses_.erase(record);
      return;
    }
    SL_INFO(logger_, "Address {} set to {:0xx}", record, address);
    addresses_.insert_or_assign(std::move(record), address);
  }

}  // namespace taiko::resolver
