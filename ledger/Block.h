#ifndef HASHCHAIN_BLOCK_H
#define HASHCHAIN_BLOCK_H

#include "Transaction.h"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hc {

/**
 * Block data structure (without hash)
 * Every field here is covered by the block hash.
 */
struct Block {
  // Version of the canonical encoding, first field of the hashed payload
  static constexpr uint16_t CURRENT_VERSION = 1;

  uint64_t index{ 0 };
  int64_t timestamp{ 0 };
  std::vector<Transaction> transactions;
  std::string previousHash;
  uint64_t nonce{ 0 };
  uint32_t difficulty{ 0 }; // Required leading zero hex digits

  template <typename Archive> void serialize(Archive &ar) {
    ar & index & timestamp & transactions & previousHash & nonce & difficulty;
  }

  /**
   * Canonical binary encoding: [version][index][timestamp][transactions]
   * [previousHash][nonce][difficulty], integers big endian, strings and
   * vectors length prefixed.
   */
  std::string ltsToString() const;
  nlohmann::json toJson() const;
};

/**
 * ChainNode data structure (Block + hash), i.e. a mined block
 */
struct ChainNode {
  Block block;
  std::string hash;

  nlohmann::json toJson() const;
};

} // namespace hc

#endif // HASHCHAIN_BLOCK_H
