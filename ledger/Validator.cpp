#include "Validator.h"
#include "Hasher.h"

#include <sstream>

namespace hc {

std::string statusToString(ValidationResult::Status status) {
  switch (status) {
  case ValidationResult::Status::VALID:
    return "VALID";
  case ValidationResult::Status::HASH_MISMATCH:
    return "HASH_MISMATCH";
  case ValidationResult::Status::BROKEN_LINK:
    return "BROKEN_LINK";
  case ValidationResult::Status::POW_NOT_MET:
    return "POW_NOT_MET";
  default:
    return "UNKNOWN";
  }
}

std::string ValidationResult::toString() const {
  if (isValid()) {
    return statusToString(status);
  }
  std::ostringstream oss;
  oss << statusToString(status) << " at block " << index;
  return oss.str();
}

std::ostream &operator<<(std::ostream &os, const ValidationResult &result) {
  return os << result.toString();
}

Validator::Validator() : Module("Validator") {}

ValidationResult Validator::validate(const std::vector<ChainNode> &chain,
                                     uint32_t difficulty) const {
  if (chain.empty()) {
    log().warning << "Chain has no genesis block";
    return ValidationResult::invalid(ValidationResult::Status::BROKEN_LINK, 0);
  }

  for (size_t i = 1; i < chain.size(); i++) {
    const auto &currentBlock = chain[i];
    const auto &previousBlock = chain[i - 1];

    if (currentBlock.hash != calculateHash(currentBlock.block)) {
      log().warning << "Block " << i << " has invalid hash";
      return ValidationResult::invalid(
          ValidationResult::Status::HASH_MISMATCH, i);
    }

    if (currentBlock.block.previousHash != previousBlock.hash) {
      log().warning << "Block " << i << " has invalid previous hash";
      return ValidationResult::invalid(ValidationResult::Status::BROKEN_LINK,
                                       i);
    }

    if (!meetsDifficulty(currentBlock.hash, difficulty)) {
      log().warning << "Block " << i << " has invalid proof of work";
      return ValidationResult::invalid(ValidationResult::Status::POW_NOT_MET,
                                       i);
    }
  }

  log().debug << "Chain of " << chain.size() << " blocks is valid";
  return ValidationResult::valid();
}

} // namespace hc
