#include "Hasher.h"
#include "../lib/Utilities.h"

namespace hc {

std::string calculateHash(const Block &block) {
  return utl::sha256(block.ltsToString());
}

bool meetsDifficulty(const std::string &hash, uint32_t difficulty) {
  if (hash.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

} // namespace hc
