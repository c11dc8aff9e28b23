#include "Ledger.h"
#include "Balance.h"
#include "../lib/Utilities.h"

#include <limits>

namespace hc {

nlohmann::json Ledger::Config::ltsToJson() const {
  nlohmann::json j;
  j["difficulty"] = difficulty;
  j["miningReward"] = miningReward;
  j["strictTransactions"] = strictTransactions;
  j["minerThreads"] = minerThreads;
  j["progressInterval"] = progressInterval;
  return j;
}

namespace {

bool isNonNegativeInteger(const nlohmann::json &value) {
  return value.is_number_unsigned() ||
         (value.is_number_integer() && value.get<int64_t>() >= 0);
}

// Rejects values that would wrap when narrowed to uint32_t
bool isUint32(const nlohmann::json &value) {
  return isNonNegativeInteger(value) &&
         value.get<uint64_t>() <= std::numeric_limits<uint32_t>::max();
}

} // namespace

Ledger::Roe<void> Ledger::Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_INPUT, "Configuration must be a JSON object");
  }

  if (jd.contains("difficulty")) {
    if (!isUint32(jd["difficulty"])) {
      return Error(E_INPUT, "Configuration 'difficulty' field must be an unsigned 32-bit integer");
    }
    difficulty = jd["difficulty"].get<uint32_t>();
  }

  if (jd.contains("miningReward")) {
    if (!jd["miningReward"].is_number()) {
      return Error(E_INPUT, "Configuration 'miningReward' field must be a number");
    }
    miningReward = jd["miningReward"].get<double>();
  }

  if (jd.contains("strictTransactions")) {
    if (!jd["strictTransactions"].is_boolean()) {
      return Error(E_INPUT, "Configuration 'strictTransactions' field must be a boolean");
    }
    strictTransactions = jd["strictTransactions"].get<bool>();
  }

  if (jd.contains("minerThreads")) {
    if (!isUint32(jd["minerThreads"]) ||
        jd["minerThreads"].get<uint64_t>() == 0) {
      return Error(E_INPUT, "Configuration 'minerThreads' field must be a positive 32-bit integer");
    }
    minerThreads = jd["minerThreads"].get<uint32_t>();
  }

  if (jd.contains("progressInterval")) {
    if (!isNonNegativeInteger(jd["progressInterval"])) {
      return Error(E_INPUT, "Configuration 'progressInterval' field must be a non-negative integer");
    }
    progressInterval = jd["progressInterval"].get<uint64_t>();
  }

  return {};
}

Ledger::Ledger() : Module("ledger") {
  miner_.redirectLogger(log().getFullName() + ".Miner");
  validator_.redirectLogger(log().getFullName() + ".Validator");
}

bool Ledger::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isInitialized_;
}

uint32_t Ledger::getDifficulty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.difficulty;
}

double Ledger::getMiningReward() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.miningReward;
}

size_t Ledger::getSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.size();
}

std::vector<ChainNode> Ledger::getChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_;
}

Ledger::Roe<ChainNode> Ledger::getBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= chain_.size()) {
    return Error(E_INPUT, "Block not found: " + std::to_string(index));
  }
  return chain_[index];
}

Ledger::Roe<ChainNode> Ledger::getLatestBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (chain_.empty()) {
    return Error(E_STATE, "Ledger is not initialized");
  }
  return chain_.back();
}

std::vector<Transaction> Ledger::getPendingTransactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pendingTxes_;
}

size_t Ledger::getPendingTransactionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pendingTxes_.size();
}

double Ledger::getBalance(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calculateBalance(chain_, address);
}

ValidationResult Ledger::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return validator_.validate(chain_, config_.difficulty);
}

bool Ledger::isValid() const { return validate().isValid(); }

Ledger::Roe<void> Ledger::init(const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (isInitialized_) {
    return Error(E_STATE, "Ledger is already initialized");
  }

  config_ = config;

  Miner::Config minerConfig = miner_.getConfig();
  minerConfig.nThreads = config_.minerThreads;
  minerConfig.progressInterval = config_.progressInterval;
  miner_.setConfig(minerConfig);

  log().info << "Initializing ledger";
  log().info << "  Difficulty: " << config_.difficulty;
  log().info << "  Mining reward: " << config_.miningReward;
  log().info << "  Strict transactions: "
             << (config_.strictTransactions ? "yes" : "no");
  log().info << "  Miner threads: " << config_.minerThreads;

  auto result = mineGenesisBlock();
  if (!result) {
    return result;
  }

  pendingTxes_.clear();
  isInitialized_ = true;
  log().info << "Ledger initialized with genesis block " << chain_[0].hash;
  return {};
}

Ledger::Roe<void> Ledger::mineGenesisBlock() {
  Block genesis;
  genesis.index = 0;
  genesis.timestamp = utl::getCurrentTime();
  genesis.previousHash = GENESIS_PREVIOUS_HASH;
  genesis.difficulty = config_.difficulty;

  miner_.setStop(false);
  auto mined = miner_.mine(genesis);
  if (!mined) {
    return Error(E_MINING,
                 "Failed to mine genesis block: " + mined.error().message);
  }

  chain_.clear();
  chain_.push_back(mined->node);
  return {};
}

Ledger::Roe<void> Ledger::addTransaction(const Transaction &tx) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isInitialized_) {
    return Error(E_STATE, "Ledger is not initialized");
  }

  if (config_.strictTransactions) {
    auto check = checkTransaction(tx);
    if (!check) {
      log().warning << "Rejected transaction " << tx.sender << " -> "
                    << tx.receiver << ": " << check.error().message;
      return Error(E_TRANSACTION, check.error().message);
    }
  }

  pendingTxes_.push_back(tx);
  log().debug << "Transaction added to pending pool: " << tx.sender << " -> "
              << tx.receiver << " " << tx.amount;
  return {};
}

Ledger::Roe<void> Ledger::addTransaction(const std::string &sender,
                                         const std::string &receiver,
                                         double amount) {
  return addTransaction(Transaction::create(sender, receiver, amount));
}

Ledger::Roe<ChainNode>
Ledger::minePendingTransactions(const std::string &minerAddress) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isInitialized_) {
    return Error(E_STATE, "Ledger is not initialized");
  }

  const ChainNode &latest = chain_.back();

  Block draft;
  draft.index = chain_.size();
  draft.timestamp = utl::getCurrentTime();
  draft.transactions = pendingTxes_;
  draft.transactions.push_back(Transaction::create(
      Transaction::SENDER_SYSTEM, minerAddress, config_.miningReward));
  draft.previousHash = latest.hash;
  draft.difficulty = config_.difficulty;

  log().info << "Mining block " << draft.index << " with "
             << draft.transactions.size() << " transactions";

  miner_.setStop(false);
  auto mined = miner_.mine(draft);
  if (!mined) {
    log().error << "Failed to mine block " << draft.index << ": "
                << mined.error().message;
    return Error(E_MINING, "Failed to mine block " +
                               std::to_string(draft.index) + ": " +
                               mined.error().message);
  }

  chain_.push_back(mined->node);
  pendingTxes_.clear();
  return chain_.back();
}

void Ledger::setMiningProgressCallback(Miner::ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  miner_.setProgressCallback(std::move(callback));
}

void Ledger::cancelMining() { miner_.setStop(true); }

Ledger::Roe<ChainNode *> Ledger::editBlock(uint64_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= chain_.size()) {
    return Error(E_INPUT, "Block not found: " + std::to_string(index));
  }
  log().warning << "Block " << index << " opened for direct modification";
  return &chain_[index];
}

} // namespace hc
