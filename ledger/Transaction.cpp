#include "Transaction.h"
#include "../lib/Utilities.h"

#include <cmath>

namespace hc {

Transaction Transaction::create(const std::string &sender,
                                const std::string &receiver, double amount) {
  Transaction tx;
  tx.sender = sender;
  tx.receiver = receiver;
  tx.amount = amount;
  tx.timestamp = utl::getCurrentTime();
  return tx;
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["sender"] = sender;
  j["receiver"] = receiver;
  j["amount"] = amount;
  j["timestamp"] = timestamp;
  return j;
}

ResultOrError<void, TransactionError> checkTransaction(const Transaction &tx) {
  if (!std::isfinite(tx.amount) || tx.amount <= 0) {
    return TransactionError(E_TX_AMOUNT, "Transaction amount must be positive: " +
                                             std::to_string(tx.amount));
  }
  if (tx.sender.empty() || tx.receiver.empty()) {
    return TransactionError(E_TX_ADDRESS, "Transaction sender and receiver are required");
  }
  if (tx.isReward()) {
    return TransactionError(E_TX_ADDRESS, std::string("Sender address is reserved: ") +
                                              Transaction::SENDER_SYSTEM);
  }
  return {};
}

} // namespace hc
