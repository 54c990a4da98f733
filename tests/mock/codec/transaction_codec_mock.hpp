/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "codec/transaction_codec.hpp"

namespace taiko::codec {

  class TransactionCodecMock : public TransactionCodec {
   public:
    MOCK_METHOD(outcome::result<Transaction>,
                decodeTransaction,
                (ChainId, qtils::BytesIn),
                (const, override));

    MOCK_METHOD(outcome::result<Receipt>,
                decodeReceipt,
                (qtils::BytesIn),
                (const, override));

    MOCK_METHOD(Hash256,
                unsignedTransactionHash,
                (ChainId, const Transaction &),
                (const, override));
  };

}  // namespace taiko::codec
