#ifndef HASHCHAIN_VALIDATOR_H
#define HASHCHAIN_VALIDATOR_H

#include "Block.h"
#include "../lib/Module.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace hc {

/**
 * Outcome of a chain integrity check. Failures carry the index of the first
 * offending block.
 */
struct ValidationResult {
  enum class Status { VALID, HASH_MISMATCH, BROKEN_LINK, POW_NOT_MET };

  Status status{ Status::VALID };
  uint64_t index{ 0 };

  static ValidationResult valid() { return {}; }
  static ValidationResult invalid(Status status, uint64_t index) {
    return { status, index };
  }

  bool isValid() const { return status == Status::VALID; }
  std::string toString() const;

  bool operator==(const ValidationResult &other) const {
    return status == other.status && index == other.index;
  }
  bool operator!=(const ValidationResult &other) const {
    return !(*this == other);
  }
};

std::string statusToString(ValidationResult::Status status);

/**
 * Validator - Read-only chain integrity checker
 *
 * Checks every block after genesis, in index order:
 * 1. stored hash equals the recomputed hash    (HASH_MISMATCH)
 * 2. previousHash equals the previous hash     (BROKEN_LINK)
 * 3. hash has `difficulty` leading zero digits (POW_NOT_MET)
 * The first failure is reported. Genesis is trusted as is.
 */
class Validator : public Module {
public:
  Validator();
  ~Validator() override = default;

  ValidationResult validate(const std::vector<ChainNode> &chain,
                            uint32_t difficulty) const;
};

std::ostream &operator<<(std::ostream &os, const ValidationResult &result);

} // namespace hc

#endif // HASHCHAIN_VALIDATOR_H
