/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>

namespace taiko::crypto {

  /**
   * Keccak-256 as used by Ethereum (original padding, not SHA3).
   * Usage: `Keccak{}.update(a).update(b).hash()` or `Keccak::hash(a)`.
   */
  struct Keccak {
    using Hash32 = qtils::ByteArr<32>;

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t RATE = 200 - HASH_LEN * 2;
    static constexpr size_t NUM_ROUNDS = 24;

    std::array<uint64_t, 25> lanes{};
    size_t offset = 0;

    Keccak &update(uint8_t byte) {
      lanes[offset / 8] ^= static_cast<uint64_t>(byte) << (8 * (offset % 8));
      if (++offset == RATE) {
        permute();
        offset = 0;
      }
      return *this;
    }

    Keccak &update(qtils::BytesIn input) {
      for (auto byte : input) {
        update(byte);
      }
      return *this;
    }

    Hash32 hash() const {
      auto copy = *this;
      return copy.finalize();
    }

    static Hash32 hash(qtils::BytesIn input) {
      return Keccak{}.update(input).hash();
    }

   private:
    Hash32 finalize() {
      lanes[offset / 8] ^= UINT64_C(0x01) << (8 * (offset % 8));
      lanes[(RATE - 1) / 8] ^= UINT64_C(0x80) << (8 * ((RATE - 1) % 8));
      permute();
      Hash32 out;
      for (size_t i = 0; i < HASH_LEN; ++i) {
        out[i] = static_cast<uint8_t>(lanes[i / 8] >> (8 * (i % 8)));
      }
      return out;
    }

    static constexpr uint64_t rotl(uint64_t x, unsigned n) {
      return (x << n) | (x >> (64 - n));
    }

    // Keccak-f[1600]
    void permute() {
      constexpr uint64_t kRoundConstants[NUM_ROUNDS] = {
          0x0000000000000001, 0x0000000000008082, 0x800000000000808a,
          0x8000000080008000, 0x000000000000808b, 0x0000000080000001,
          0x8000000080008081, 0x8000000000008009, 0x000000000000008a,
          0x0000000000000088, 0x0000000080008009, 0x000000008000000a,
          0x000000008000808b, 0x800000000000008b, 0x8000000000008089,
          0x8000000000008003, 0x8000000000008002, 0x8000000000000080,
          0x000000000000800a, 0x800000008000000a, 0x8000000080008081,
          0x8000000000008080, 0x0000000080000001, 0x8000000080008008,
      };
      constexpr unsigned kRotations[24] = {
          1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
          27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44,
      };
      constexpr size_t kPiLanes[24] = {
          10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
          15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1,
      };

      uint64_t c[5];
      for (auto rc : kRoundConstants) {
        // Theta
        for (size_t x = 0; x < 5; ++x) {
          c[x] = lanes[x] ^ lanes[x + 5] ^ lanes[x + 10] ^ lanes[x + 15]
               ^ lanes[x + 20];
        }
        for (size_t x = 0; x < 5; ++x) {
          auto d = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
          for (size_t y = 0; y < 25; y += 5) {
            lanes[y + x] ^= d;
          }
        }

        // Rho and pi
        auto carry = lanes[1];
        for (size_t i = 0; i < 24; ++i) {
          auto j = kPiLanes[i];
          auto next = lanes[j];
          lanes[j] = rotl(carry, kRotations[i]);
          carry = next;
        }

        // Chi
        for (size_t y = 0; y < 25; y += 5) {
          for (size_t x = 0; x < 5; ++x) {
            c[x] = lanes[y + x];
          }
          for (size_t x = 0; x < 5; ++x) {
            lanes[y + x] ^= ~c[(x + 1) % 5] & c[(x + 2) % 5];
          }
        }

        // Iota
        lanes[0] ^= rc;
      }
    }
  };

  inline qtils::ByteArr<32> keccak256(qtils::BytesIn input) {
    return Keccak::hash(input);
  }

}  // namespace taiko::crypto
