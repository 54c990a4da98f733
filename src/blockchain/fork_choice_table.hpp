/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <unordered_map>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/fork_choice.hpp"
#include "types/protocol_config.hpp"

namespace taiko::blockchain {

  /**
   * Fork choices by (block id, parent hash). Records are kept in an arena
   * and never removed; references handed out stay valid for the table's
   * lifetime.
   */
  class ForkChoiceTable {
   public:
    enum class Error {
      TABLE_FULL,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::TABLE_FULL:
          return "Fork choice table is full";
      }
      abort();
    }

    struct Handle {
      ForkChoice &choice;
      /// Record did not exist before the call
      bool inserted;
    };

    ForkChoiceTable(qtils::SharedRef<log::LoggingSystem> logsys,
                    ProtocolConfig config);

    const ForkChoice *find(const ForkChoiceKey &key) const;

    ForkChoice *find(const ForkChoiceKey &key);

    /**
     * Existing record of `key`, or a new empty one.
     * Fails without inserting when the table is at capacity.
     */
    outcome::result<Handle> getOrInsert(const ForkChoiceKey &key);

    size_t size() const {
      return arena_.size();
    }

    /// Zero means unbounded
    size_t capacity() const {
      return capacity_;
    }

    /// All records in insertion order
    template <typename F>
    void forEach(const F &f) const {
      for (auto &[key, choice] : arena_) {
        f(key, choice);
      }
    }

   private:
    struct Record {
      ForkChoiceKey key;
      ForkChoice choice;
    };

    log::Logger logger_;
    size_t capacity_;
    std::deque<Record> arena_;
    std::unordered_map<ForkChoiceKey, size_t> index_;
  };

}  // namespace taiko::blockchain
