/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/rlp/block_header_rlp.hpp"

#include <boost/endian/conversion.hpp>

#include "crypto/keccak.hpp"
#include "serde/rlp/rlp_encode.hpp"

namespace taiko::rlp {

  qtils::ByteVec encodeBlockHeader(const BlockHeader &header) {
    qtils::ByteArr<8> nonce;
    boost::endian::store_big_u64(nonce.data(), header.nonce);

    std::vector<qtils::ByteVec> items{
        encodeBytes(header.parent_hash),
        encodeBytes(header.ommers_hash),
        encodeBytes(header.beneficiary),
        encodeBytes(header.state_root),
        encodeBytes(header.transactions_root),
        encodeBytes(header.receipts_root),
        encodeBytes(header.logs_bloom),
        encodeUint(header.difficulty),
        encodeUint(header.height),
        encodeUint(header.gas_limit),
        encodeUint(header.gas_used),
        encodeUint(header.timestamp),
        encodeBytes(header.extra_data.data()),
        encodeBytes(header.mix_hash),
        encodeBytes(nonce),
    };
    if (header.base_fee_per_gas != 0) {
      items.emplace_back(encodeUint(header.base_fee_per_gas));
    }
    return encodeList(items);
  }

  BlockHash hashBlockHeader(const BlockHeader &header) {
    return crypto::keccak256(encodeBlockHeader(header));
  }

}  // namespace taiko::rlp
