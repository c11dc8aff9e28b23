#ifndef HASHCHAIN_LEDGER_H
#define HASHCHAIN_LEDGER_H

#include "Block.h"
#include "Miner.h"
#include "Transaction.h"
#include "Validator.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hc {

/**
 * Ledger - In-memory proof-of-work chain
 *
 * Responsibilities:
 * - Own the chain of mined blocks, starting with a mined genesis block
 * - Pool submitted transactions until the next block is mined
 * - Mine the whole pool plus a reward transaction into one block
 * - Answer balance and integrity queries over the chain
 *
 * addTransaction() and minePendingTransactions() are serialized by one mutex,
 * so a block always takes the complete pool and leaves it empty.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STATE = 1;       // Not initialized / initialized twice
  constexpr static int32_t E_TRANSACTION = 2; // Rejected by strict checks
  constexpr static int32_t E_MINING = 3;      // Nonce search failed or was cancelled
  constexpr static int32_t E_INPUT = 4;       // Invalid argument

  // previousHash of the genesis block
  constexpr static const char *GENESIS_PREVIOUS_HASH = "0";

  struct Config {
    uint32_t difficulty{ 4 };
    double miningReward{ 100.0 };
    bool strictTransactions{ false }; // Reject malformed transactions
    uint32_t minerThreads{ 1 };
    uint64_t progressInterval{ 10000 }; // Hashes between progress reports

    nlohmann::json ltsToJson() const;
    // Missing fields keep their current value
    ResultOrError<void, Error> ltsFromJson(const nlohmann::json &jd);
  };

  Ledger();
  ~Ledger() override = default;

  // ----------------- accessors -------------------------------------
  bool isInitialized() const;
  uint32_t getDifficulty() const;
  double getMiningReward() const;
  size_t getSize() const;
  std::vector<ChainNode> getChain() const;
  Roe<ChainNode> getBlock(uint64_t index) const;
  Roe<ChainNode> getLatestBlock() const;
  std::vector<Transaction> getPendingTransactions() const;
  size_t getPendingTransactionCount() const;
  double getBalance(const std::string &address) const;
  ValidationResult validate() const;
  bool isValid() const;

  // ----------------- methods -------------------------------------
  /**
   * Set up the chain with a freshly mined genesis block
   */
  Roe<void> init(const Config &config);

  Roe<void> addTransaction(const Transaction &tx);
  Roe<void> addTransaction(const std::string &sender,
                           const std::string &receiver, double amount);

  /**
   * Mine all pending transactions plus the reward for minerAddress into a
   * new block and append it. Works on an empty pool too. On failure the
   * chain and the pool are left as they were.
   */
  Roe<ChainNode> minePendingTransactions(const std::string &minerAddress);

  /**
   * Progress of nonce searches; must not call back into the ledger
   */
  void setMiningProgressCallback(Miner::ProgressCallback callback);

  /**
   * Abort a nonce search in progress. Safe to call from any thread.
   */
  void cancelMining();

  /**
   * Direct write access to a stored block, bypassing all integrity rules.
   * For tamper demonstrations and tests only.
   */
  Roe<ChainNode *> editBlock(uint64_t index);

private:
  Roe<void> mineGenesisBlock();

  Config config_;
  bool isInitialized_{ false };
  std::vector<ChainNode> chain_;
  std::vector<Transaction> pendingTxes_;
  Miner miner_;
  Validator validator_;
  mutable std::mutex mutex_;
};

} // namespace hc

#endif // HASHCHAIN_LEDGER_H
