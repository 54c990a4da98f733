/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/receipt.hpp"
#include "types/transaction.hpp"

namespace taiko::codec {

  /**
   * Decoder of L2 transactions and receipts as they are stored in the
   * transactions and receipts tries.
   */
  class TransactionCodec {
   public:
    enum class Error {
      UNSUPPORTED_TYPE,
      FIELD_COUNT,
      CHAIN_ID_MISMATCH,
      INVALID_DESTINATION,
      INVALID_STATUS,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::UNSUPPORTED_TYPE:
          return "Unsupported transaction envelope type";
        case E::FIELD_COUNT:
          return "Unexpected number of fields";
        case E::CHAIN_ID_MISMATCH:
          return "Transaction is signed for another chain";
        case E::INVALID_DESTINATION:
          return "Destination is neither empty nor an address";
        case E::INVALID_STATUS:
          return "Receipt status is neither success nor failure";
      }
      abort();
    }

    virtual ~TransactionCodec() = default;

    virtual outcome::result<Transaction> decodeTransaction(
        ChainId chain_id, qtils::BytesIn encoded) const = 0;

    virtual outcome::result<Receipt> decodeReceipt(
        qtils::BytesIn encoded) const = 0;

    /// Digest the sender signed, signature fields excluded
    virtual Hash256 unsignedTransactionHash(ChainId chain_id,
                                            const Transaction &tx) const = 0;
  };

}  // namespace taiko::codec
