/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/transaction_codec.hpp"

namespace taiko::codec {

  /**
   * Ethereum encoding: legacy transactions are a plain RLP list, typed
   * transactions (EIP-2718) are `type || rlp(fields)`.
   */
  class RlpTransactionCodec : public TransactionCodec {
   public:
    // TransactionCodec
    outcome::result<Transaction> decodeTransaction(
        ChainId chain_id, qtils::BytesIn encoded) const override;
    outcome::result<Receipt> decodeReceipt(
        qtils::BytesIn encoded) const override;
    Hash256 unsignedTransactionHash(ChainId chain_id,
                                    const Transaction &tx) const override;
  };

}  // namespace taiko::codec
