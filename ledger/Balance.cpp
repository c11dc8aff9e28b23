#include "Balance.h"

namespace hc {

double calculateBalance(const std::vector<ChainNode> &chain,
                        const std::string &address) {
  double balance = 0;
  for (const auto &node : chain) {
    for (const auto &tx : node.block.transactions) {
      if (tx.sender == address) {
        balance -= tx.amount;
      }
      if (tx.receiver == address) {
        balance += tx.amount;
      }
    }
  }
  return balance;
}

std::map<std::string, double>
calculateBalances(const std::vector<ChainNode> &chain) {
  std::map<std::string, double> balances;
  for (const auto &node : chain) {
    for (const auto &tx : node.block.transactions) {
      balances[tx.sender] -= tx.amount;
      balances[tx.receiver] += tx.amount;
    }
  }
  return balances;
}

} // namespace hc
