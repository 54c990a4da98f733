/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "resolver/address_resolver.hpp"

namespace taiko::resolver {

  class AddressResolverMock : public AddressResolver {
   public:
    MOCK_METHOD(outcome::result<Address>,
                resolve,
                (ChainId, std::string_view, bool),
                (const, override));
  };

}  // namespace taiko::resolver
