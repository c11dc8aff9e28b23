#ifndef HASHCHAIN_TRANSACTION_H
#define HASHCHAIN_TRANSACTION_H

#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hc {

/**
 * Value transfer record. Immutable once created by convention: the ledger
 * only ever copies transactions, it never edits them.
 */
struct Transaction {
  // Sender of mining reward transactions
  constexpr static const char *SENDER_SYSTEM = "SYSTEM";

  std::string sender;
  std::string receiver;
  double amount{ 0 };
  int64_t timestamp{ 0 }; // Seconds since epoch

  /**
   * Create a transaction stamped with the current wall clock time
   */
  static Transaction create(const std::string &sender,
                            const std::string &receiver, double amount);

  bool isReward() const { return sender == SENDER_SYSTEM; }

  template <typename Archive> void serialize(Archive &ar) {
    ar & sender & receiver & amount & timestamp;
  }

  nlohmann::json toJson() const;
};

struct TransactionError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

constexpr int32_t E_TX_AMOUNT = 1;  // Amount not finite or not positive
constexpr int32_t E_TX_ADDRESS = 2; // Empty or reserved address

/**
 * Check a user submitted transaction for malformed input.
 * Balance sufficiency is not checked.
 */
ResultOrError<void, TransactionError> checkTransaction(const Transaction &tx);

} // namespace hc

#endif // HASHCHAIN_TRANSACTION_H
