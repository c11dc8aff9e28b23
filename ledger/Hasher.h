#ifndef HASHCHAIN_HASHER_H
#define HASHCHAIN_HASHER_H

#include "Block.h"

#include <cstdint>
#include <string>

namespace hc {

/**
 * SHA-256 over the canonical encoding of the block (Block::ltsToString),
 * rendered as 64 lowercase hex characters.
 */
std::string calculateHash(const Block &block);

/**
 * Proof-of-work predicate
 * @return true if the first `difficulty` characters of hash are '0'
 */
bool meetsDifficulty(const std::string &hash, uint32_t difficulty);

} // namespace hc

#endif // HASHCHAIN_HASHER_H
