/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_vec.hpp>

#include "types/block_header.hpp"
#include "types/transaction.hpp"
#include "types/types.hpp"

namespace taiko {

  struct Log {
    Address address;
    std::vector<Hash256> topics;
    qtils::ByteVec data;
  };

  enum class TxStatus : uint8_t {
    FAILED = 0,
    SUCCESS = 1,
  };

  struct Receipt {
    TransactionType type = TransactionType::LEGACY;
    TxStatus status = TxStatus::FAILED;
    uint64_t cumulative_gas_used = 0;
    LogsBloom logs_bloom;
    std::vector<Log> logs;
  };

}  // namespace taiko
