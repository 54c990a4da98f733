/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/fork_choice_table.hpp"

namespace taiko::blockchain {

  ForkChoiceTable::ForkChoiceTable(qtils::SharedRef<log::LoggingSystem> logsys,
                                   ProtocolConfig config)
      : logger_{logsys->getLogger("ForkChoice", "taiko")},
        capacity_{config.fork_choice_capacity} {}

  const ForkChoice *ForkChoiceTable::find(const ForkChoiceKey &key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    return &arena_[it->second].choice;
  }

  ForkChoice *ForkChoiceTable::find(const ForkChoiceKey &key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    return &arena_[it->second].choice;
  }

  outcome::result<ForkChoiceTable::Handle> ForkChoiceTable::getOrInsert(
      const ForkChoiceKey &key) {
    if (auto choice = find(key)) {
      return Handle{*choice, false};
    }
    if (capacity_ != 0 and arena_.size() >= capacity_) {
      SL_WARN(logger_, "Can't track fork choice {}, table is full", key);
      return Error::TABLE_FULL;
    }
    index_.emplace(key, arena_.size());
    auto &record = arena_.emplace_back(Record{.key = key, .choice = {}});
    SL_TRACE(logger_, "New fork choice {}", key);
    return Handle{record.choice, true};
  }

}  // namespace taiko::blockchain
