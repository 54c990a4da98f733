/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/impl/rlp_transaction_codec.hpp"

#include <algorithm>
#include <limits>

#include "crypto/keccak.hpp"
#include "serde/rlp/rlp_decode.hpp"
#include "serde/rlp/rlp_encode.hpp"

namespace taiko::codec {

  namespace {
    constexpr size_t kNoChainId = std::numeric_limits<size_t>::max();

    /// Position of the interesting fields inside an envelope
    struct Layout {
      size_t field_count;
      size_t chain_id;
      size_t nonce;
      size_t gas_limit;
      size_t destination;
      size_t amount;
      size_t data;
      size_t v;
    };

    // [nonce, gasPrice, gasLimit, to, value, data, v, r, s]
    constexpr Layout kLegacyLayout{9, kNoChainId, 0, 2, 3, 4, 5, 6};
    // [chainId, nonce, gasPrice, gasLimit, to, value, data, accessList,
    //  yParity, r, s]
    constexpr Layout kAccessListLayout{11, 0, 1, 3, 4, 5, 6, 8};
    // [chainId, nonce, maxPriorityFee, maxFee, gasLimit, to, value, data,
    //  accessList, yParity, r, s]
    constexpr Layout kDynamicFeeLayout{12, 0, 1, 4, 5, 6, 7, 9};

    constexpr uint64_t kLegacyV = 27;
    constexpr uint64_t kEip155V = 35;

    outcome::result<std::vector<qtils::BytesIn>> splitList(
        qtils::BytesIn &enc) {
      OUTCOME_TRY(payload, rlp::decodeList(enc));
      std::vector<qtils::BytesIn> items;
      while (not payload.empty()) {
        OUTCOME_TRY(item, rlp::decodeItem(payload));
        items.push_back(item);
      }
      return items;
    }

    outcome::result<uint64_t> uintField(qtils::BytesIn item) {
      return rlp::decodeUint(item);
    }

    outcome::result<TransactionType> envelopeType(qtils::BytesIn &encoded) {
      if (encoded.empty()) {
        return rlp::RlpError::INPUT_TOO_SHORT;
      }
      if (rlp::isList(encoded)) {
        return TransactionType::LEGACY;
      }
      auto type = encoded[0];
      if (type != static_cast<uint8_t>(TransactionType::ACCESS_LIST)
          and type != static_cast<uint8_t>(TransactionType::DYNAMIC_FEE)) {
        return TransactionCodec::Error::UNSUPPORTED_TYPE;
      }
      encoded = encoded.subspan(1);
      return static_cast<TransactionType>(type);
    }

    const Layout &layoutOf(TransactionType type) {
      switch (type) {
        case TransactionType::LEGACY:
          return kLegacyLayout;
        case TransactionType::ACCESS_LIST:
          return kAccessListLayout;
        case TransactionType::DYNAMIC_FEE:
          return kDynamicFeeLayout;
      }
      return kLegacyLayout;
    }

    outcome::result<Log> decodeLog(qtils::BytesIn item) {
      OUTCOME_TRY(fields, splitList(item));
      OUTCOME_TRY(rlp::expectEnd(item));
      if (fields.size() != 3) {
        return TransactionCodec::Error::FIELD_COUNT;
      }
      Log entry;
      OUTCOME_TRY(address, rlp::decodeFixed<20>(fields[0]));
      entry.address = address;
      OUTCOME_TRY(topics, splitList(fields[1]));
      for (auto topic : topics) {
        OUTCOME_TRY(hash, rlp::decodeFixed<32>(topic));
        entry.topics.emplace_back(hash);
      }
      OUTCOME_TRY(data, rlp::decodeString(fields[2]));
      entry.data.assign(data.begin(), data.end());
      return entry;
    }
  }  // namespace

  outcome::result<Transaction> RlpTransactionCodec::decodeTransaction(
      ChainId chain_id, qtils::BytesIn encoded) const {
    Transaction tx;
    OUTCOME_TRY(type, envelopeType(encoded));
    tx.type = type;
    auto &layout = layoutOf(type);

    OUTCOME_TRY(fields, splitList(encoded));
    OUTCOME_TRY(rlp::expectEnd(encoded));
    if (fields.size() != layout.field_count) {
      return Error::FIELD_COUNT;
    }

    OUTCOME_TRY(nonce, uintField(fields[layout.nonce]));
    tx.nonce = nonce;
    OUTCOME_TRY(gas_limit, uintField(fields[layout.gas_limit]));
    tx.gas_limit = gas_limit;

    auto destination_item = fields[layout.destination];
    OUTCOME_TRY(destination, rlp::decodeString(destination_item));
    if (destination.size() == Address{}.size()) {
      Address address;
      std::ranges::copy(destination, address.begin());
      tx.destination = address;
    } else if (not destination.empty()) {
      return Error::INVALID_DESTINATION;
    }

    auto amount_item = fields[layout.amount];
    OUTCOME_TRY(amount, rlp::decodeString(amount_item));
    tx.amount.assign(amount.begin(), amount.end());
    auto data_item = fields[layout.data];
    OUTCOME_TRY(data, rlp::decodeString(data_item));
    tx.data.assign(data.begin(), data.end());

    OUTCOME_TRY(v, uintField(fields[layout.v]));
    tx.v = v;
    auto r_item = fields[layout.v + 1];
    OUTCOME_TRY(r, rlp::decodeUint256(r_item));
    tx.r = r;
    auto s_item = fields[layout.v + 2];
    OUTCOME_TRY(s, rlp::decodeUint256(s_item));
    tx.s = s;

    if (layout.chain_id != kNoChainId) {
      OUTCOME_TRY(tx_chain_id, uintField(fields[layout.chain_id]));
      tx.chain_id = tx_chain_id;
    } else if (v >= kEip155V) {
      tx.chain_id = (v - kEip155V) / 2;
    } else if (v != kLegacyV and v != kLegacyV + 1) {
      return Error::CHAIN_ID_MISMATCH;
    }
    if (tx.chain_id != 0 and tx.chain_id != chain_id) {
      return Error::CHAIN_ID_MISMATCH;
    }

    for (size_t i = 0; i < layout.v; ++i) {
      tx.unsigned_fields.emplace_back(fields[i].begin(), fields[i].end());
    }
    return tx;
  }

  outcome::result<Receipt> RlpTransactionCodec::decodeReceipt(
      qtils::BytesIn encoded) const {
    Receipt receipt;
    OUTCOME_TRY(type, envelopeType(encoded));
    receipt.type = type;

    OUTCOME_TRY(fields, splitList(encoded));
    OUTCOME_TRY(rlp::expectEnd(encoded));
    if (fields.size() != 4) {
      return Error::FIELD_COUNT;
    }

    OUTCOME_TRY(status, rlp::decodeString(fields[0]));
    if (status.empty()) {
      receipt.status = TxStatus::FAILED;
    } else if (status.size() == 1 and status[0] == 1) {
      receipt.status = TxStatus::SUCCESS;
    } else {
      return Error::INVALID_STATUS;
    }
    OUTCOME_TRY(cumulative_gas_used, uintField(fields[1]));
    receipt.cumulative_gas_used = cumulative_gas_used;
    OUTCOME_TRY(logs_bloom, rlp::decodeFixed<LOGS_BLOOM_SIZE>(fields[2]));
    receipt.logs_bloom = logs_bloom;

    OUTCOME_TRY(logs, splitList(fields[3]));
    for (auto item : logs) {
      OUTCOME_TRY(entry, decodeLog(item));
      receipt.logs.emplace_back(std::move(entry));
    }
    return receipt;
  }

  Hash256 RlpTransactionCodec::unsignedTransactionHash(
      ChainId chain_id, const Transaction &tx) const {
    if (tx.type == TransactionType::LEGACY) {
      // EIP-155
      auto items = tx.unsigned_fields;
      items.emplace_back(rlp::encodeUint(chain_id));
      items.emplace_back(rlp::encodeUint(0));
      items.emplace_back(rlp::encodeUint(0));
      return crypto::keccak256(rlp::encodeList(items));
    }
    auto type = static_cast<uint8_t>(tx.type);
    return crypto::Keccak{}
        .update(type)
        .update(rlp::encodeList(tx.unsigned_fields))
        .hash();
  }

}  // namespace taiko::codec
