#include "../Ledger.h"
#include "../Hasher.h"
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace hc;

class LedgerTest : public ::testing::Test {
protected:
  Ledger::Config createConfig() {
    Ledger::Config config;
    config.difficulty = 2;
    config.miningReward = 100;
    return config;
  }

  void initLedger(Ledger &ledger) {
    auto result = ledger.init(createConfig());
    ASSERT_TRUE(result.isOk()) << result.error().message;
  }
};

TEST_F(LedgerTest, InitCreatesMinedGenesis) {
  Ledger ledger;
  EXPECT_FALSE(ledger.isInitialized());
  initLedger(ledger);

  EXPECT_TRUE(ledger.isInitialized());
  ASSERT_EQ(ledger.getSize(), 1u);
  auto genesis = ledger.getBlock(0);
  ASSERT_TRUE(genesis.isOk());
  EXPECT_EQ(genesis->block.index, 0u);
  EXPECT_EQ(genesis->block.previousHash, Ledger::GENESIS_PREVIOUS_HASH);
  EXPECT_TRUE(genesis->block.transactions.empty());
  EXPECT_EQ(genesis->hash, calculateHash(genesis->block));
  EXPECT_TRUE(meetsDifficulty(genesis->hash, 2));
  EXPECT_TRUE(ledger.isValid());
}

TEST_F(LedgerTest, InitTwiceFails) {
  Ledger ledger;
  initLedger(ledger);
  auto result = ledger.init(createConfig());
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Ledger::E_STATE);
}

TEST_F(LedgerTest, UninitializedLedgerRejectsOperations) {
  Ledger ledger;

  auto add = ledger.addTransaction("Alice", "Bob", 50);
  ASSERT_TRUE(add.isError());
  EXPECT_EQ(add.error().code, Ledger::E_STATE);

  auto mine = ledger.minePendingTransactions("Miner1");
  ASSERT_TRUE(mine.isError());
  EXPECT_EQ(mine.error().code, Ledger::E_STATE);

  EXPECT_TRUE(ledger.getLatestBlock().isError());
  EXPECT_FALSE(ledger.isValid());
}

TEST_F(LedgerTest, AccessorsReflectConfig) {
  Ledger ledger;
  initLedger(ledger);
  EXPECT_EQ(ledger.getDifficulty(), 2u);
  EXPECT_DOUBLE_EQ(ledger.getMiningReward(), 100);
}

TEST_F(LedgerTest, AddTransactionGoesToPool) {
  Ledger ledger;
  initLedger(ledger);

  ASSERT_TRUE(ledger.addTransaction("Alice", "Bob", 50).isOk());
  ASSERT_TRUE(ledger.addTransaction("Bob", "Charlie", 25).isOk());

  auto pending = ledger.getPendingTransactions();
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].sender, "Alice");
  EXPECT_EQ(pending[1].sender, "Bob");
  EXPECT_EQ(ledger.getSize(), 1u);
}

TEST_F(LedgerTest, MiningTakesPoolAndAddsReward) {
  Ledger ledger;
  initLedger(ledger);
  ASSERT_TRUE(ledger.addTransaction("Alice", "Bob", 50).isOk());

  auto mined = ledger.minePendingTransactions("Miner1");
  ASSERT_TRUE(mined.isOk()) << mined.error().message;

  EXPECT_EQ(ledger.getSize(), 2u);
  EXPECT_EQ(ledger.getPendingTransactionCount(), 0u);

  const Block &block = mined->block;
  EXPECT_EQ(block.index, 1u);
  ASSERT_EQ(block.transactions.size(), 2u);
  EXPECT_EQ(block.transactions[0].sender, "Alice");
  EXPECT_TRUE(block.transactions[1].isReward());
  EXPECT_EQ(block.transactions[1].receiver, "Miner1");
  EXPECT_DOUBLE_EQ(block.transactions[1].amount, 100);

  EXPECT_DOUBLE_EQ(ledger.getBalance("Bob"), 50);
  EXPECT_DOUBLE_EQ(ledger.getBalance("Miner1"), 100);
  EXPECT_DOUBLE_EQ(ledger.getBalance("Alice"), -50);
}

TEST_F(LedgerTest, EmptyPoolMinesRewardOnlyBlock) {
  Ledger ledger;
  initLedger(ledger);

  auto mined = ledger.minePendingTransactions("Miner1");
  ASSERT_TRUE(mined.isOk());
  ASSERT_EQ(mined->block.transactions.size(), 1u);
  EXPECT_TRUE(mined->block.transactions[0].isReward());
  EXPECT_DOUBLE_EQ(ledger.getBalance("Miner1"), 100);
}

TEST_F(LedgerTest, BlocksLinkToPredecessor) {
  Ledger ledger;
  initLedger(ledger);
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(ledger.addTransaction("Alice", "Bob", 1 + i).isOk());
    ASSERT_TRUE(ledger.minePendingTransactions("Miner1").isOk());
  }

  auto chain = ledger.getChain();
  ASSERT_EQ(chain.size(), 4u);
  for (size_t i = 1; i < chain.size(); ++i) {
    EXPECT_EQ(chain[i].block.index, i);
    EXPECT_EQ(chain[i].block.previousHash, chain[i - 1].hash);
    EXPECT_EQ(chain[i].hash, calculateHash(chain[i].block));
    EXPECT_TRUE(meetsDifficulty(chain[i].hash, 2));
  }
  auto latest = ledger.getLatestBlock();
  ASSERT_TRUE(latest.isOk());
  EXPECT_EQ(latest->hash, chain.back().hash);
  EXPECT_TRUE(ledger.isValid());
}

TEST_F(LedgerTest, GetBlockOutOfRange) {
  Ledger ledger;
  initLedger(ledger);
  auto result = ledger.getBlock(5);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Ledger::E_INPUT);
}

TEST_F(LedgerTest, TamperingIsDetected) {
  Ledger ledger;
  initLedger(ledger);
  ASSERT_TRUE(ledger.addTransaction("Alice", "Bob", 50).isOk());
  ASSERT_TRUE(ledger.minePendingTransactions("Miner1").isOk());
  ASSERT_TRUE(ledger.addTransaction("Charlie", "Alice", 10).isOk());
  ASSERT_TRUE(ledger.minePendingTransactions("Miner1").isOk());
  ASSERT_TRUE(ledger.isValid());

  auto edit = ledger.editBlock(1);
  ASSERT_TRUE(edit.isOk());
  edit.value()->block.transactions[0].amount = 1000;

  auto result = ledger.validate();
  EXPECT_EQ(result, ValidationResult::invalid(
                        ValidationResult::Status::HASH_MISMATCH, 1));
  EXPECT_FALSE(ledger.isValid());
}

TEST_F(LedgerTest, EditBlockOutOfRange) {
  Ledger ledger;
  initLedger(ledger);
  auto result = ledger.editBlock(1);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Ledger::E_INPUT);
}

TEST_F(LedgerTest, LenientModeAcceptsAnyTransaction) {
  Ledger ledger;
  initLedger(ledger);
  EXPECT_TRUE(ledger.addTransaction("Alice", "Bob", -5).isOk());
  EXPECT_TRUE(ledger.addTransaction("", "Bob", 5).isOk());
  EXPECT_EQ(ledger.getPendingTransactionCount(), 2u);
}

TEST_F(LedgerTest, StrictModeRejectsMalformedTransactions) {
  Ledger ledger;
  Ledger::Config config = createConfig();
  config.strictTransactions = true;
  ASSERT_TRUE(ledger.init(config).isOk());

  auto negative = ledger.addTransaction("Alice", "Bob", -5);
  ASSERT_TRUE(negative.isError());
  EXPECT_EQ(negative.error().code, Ledger::E_TRANSACTION);

  auto forged = ledger.addTransaction(Transaction::SENDER_SYSTEM, "Bob", 5);
  ASSERT_TRUE(forged.isError());
  EXPECT_EQ(forged.error().code, Ledger::E_TRANSACTION);

  EXPECT_TRUE(ledger.addTransaction("Alice", "Bob", 5).isOk());
  EXPECT_EQ(ledger.getPendingTransactionCount(), 1u);
}

TEST_F(LedgerTest, ParallelMiningProducesValidChain) {
  Ledger parallel;
  Ledger::Config config = createConfig();
  config.minerThreads = 4;
  ASSERT_TRUE(parallel.init(config).isOk());

  auto mined = parallel.minePendingTransactions("Miner1");
  ASSERT_TRUE(mined.isOk());
  EXPECT_TRUE(meetsDifficulty(mined->hash, 2));
  EXPECT_TRUE(parallel.isValid());
}

TEST_F(LedgerTest, CancelledMiningLeavesStateUnchanged) {
  Ledger ledger;
  Ledger::Config config = createConfig();
  config.difficulty = 3;
  config.progressInterval = 1;
  ASSERT_TRUE(ledger.init(config).isOk());
  ASSERT_TRUE(ledger.addTransaction("Alice", "Bob", 50).isOk());
  auto before = ledger.getLatestBlock();
  ASSERT_TRUE(before.isOk());

  ledger.setMiningProgressCallback(
      [&ledger](uint64_t) { ledger.cancelMining(); });
  auto cancelled = ledger.minePendingTransactions("Miner1");
  if (cancelled.isOk()) {
    GTEST_SKIP() << "First nonce already met the difficulty";
  }
  EXPECT_EQ(cancelled.error().code, Ledger::E_MINING);
  EXPECT_EQ(ledger.getSize(), 1u);
  EXPECT_EQ(ledger.getPendingTransactionCount(), 1u);
  EXPECT_EQ(ledger.getLatestBlock()->hash, before->hash);

  // The next search starts with the stop flag cleared
  ledger.setMiningProgressCallback(nullptr);
  auto mined = ledger.minePendingTransactions("Miner1");
  ASSERT_TRUE(mined.isOk()) << mined.error().message;
  EXPECT_EQ(ledger.getSize(), 2u);
  EXPECT_EQ(ledger.getPendingTransactionCount(), 0u);
  EXPECT_TRUE(ledger.isValid());
}

TEST_F(LedgerTest, ConcurrentSubmissionsAllLand) {
  Ledger ledger;
  initLedger(ledger);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&ledger, t]() {
      for (int i = 0; i < 25; ++i) {
        EXPECT_TRUE(
            ledger.addTransaction("User" + std::to_string(t), "Bob", 1).isOk());
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(ledger.getPendingTransactionCount(), 100u);
  auto mined = ledger.minePendingTransactions("Miner1");
  ASSERT_TRUE(mined.isOk());
  EXPECT_EQ(mined->block.transactions.size(), 101u);
  EXPECT_DOUBLE_EQ(ledger.getBalance("Bob"), 100);
}

TEST(LedgerConfigTest, FromJsonOverridesPresentFields) {
  Ledger::Config config;
  nlohmann::json j = { { "difficulty", 3 }, { "minerThreads", 2 } };
  ASSERT_TRUE(config.ltsFromJson(j).isOk());
  EXPECT_EQ(config.difficulty, 3u);
  EXPECT_EQ(config.minerThreads, 2u);
  EXPECT_DOUBLE_EQ(config.miningReward, 100);
  EXPECT_FALSE(config.strictTransactions);
}

TEST(LedgerConfigTest, FromJsonRejectsWrongTypes) {
  Ledger::Config config;
  EXPECT_TRUE(config.ltsFromJson({ { "difficulty", "four" } }).isError());
  EXPECT_TRUE(config.ltsFromJson({ { "difficulty", -1 } }).isError());
  EXPECT_TRUE(config.ltsFromJson({ { "minerThreads", 0 } }).isError());
  EXPECT_TRUE(config.ltsFromJson({ { "strictTransactions", 1 } }).isError());
  EXPECT_TRUE(config.ltsFromJson(nlohmann::json::array()).isError());
  EXPECT_TRUE(
      config.ltsFromJson({ { "progressInterval", -1 } }).isError());
  EXPECT_EQ(config.difficulty, 4u);
}

TEST(LedgerConfigTest, FromJsonRejectsValuesBeyond32Bits) {
  Ledger::Config config;

  auto difficulty = config.ltsFromJson(
      nlohmann::json::parse(R"({"difficulty": 4294967297})"));
  ASSERT_TRUE(difficulty.isError());
  EXPECT_EQ(difficulty.error().code, Ledger::E_INPUT);

  auto threads = config.ltsFromJson(
      nlohmann::json::parse(R"({"minerThreads": 4294967296})"));
  ASSERT_TRUE(threads.isError());
  EXPECT_EQ(threads.error().code, Ledger::E_INPUT);

  EXPECT_EQ(config.difficulty, 4u);
  EXPECT_EQ(config.minerThreads, 1u);

  ASSERT_TRUE(config
                  .ltsFromJson(nlohmann::json::parse(
                      R"({"difficulty": 4294967295, "minerThreads": 4294967295})"))
                  .isOk());
  EXPECT_EQ(config.difficulty, 4294967295u);
  EXPECT_EQ(config.minerThreads, 4294967295u);
}

TEST(LedgerConfigTest, ProgressIntervalFromJson) {
  Ledger::Config config;
  ASSERT_TRUE(config
                  .ltsFromJson(nlohmann::json::parse(
                      R"({"progressInterval": 500})"))
                  .isOk());
  EXPECT_EQ(config.progressInterval, 500u);
  EXPECT_EQ(config.difficulty, 4u);
}

TEST(LedgerConfigTest, OverridesKeepUntouchedFileValues) {
  // File document first, then the command line options that were given
  Ledger::Config config;
  ASSERT_TRUE(config
                  .ltsFromJson(nlohmann::json::parse(
                      R"({"difficulty": 3, "miningReward": 25.0,
                          "minerThreads": 2, "progressInterval": 500})"))
                  .isOk());

  nlohmann::json overrides = nlohmann::json::object();
  overrides["difficulty"] = 5u;
  overrides["strictTransactions"] = true;
  ASSERT_TRUE(config.ltsFromJson(overrides).isOk());

  EXPECT_EQ(config.difficulty, 5u);
  EXPECT_TRUE(config.strictTransactions);
  EXPECT_DOUBLE_EQ(config.miningReward, 25.0);
  EXPECT_EQ(config.minerThreads, 2u);
  EXPECT_EQ(config.progressInterval, 500u);
}

TEST_F(LedgerTest, ProgressIntervalReachesMiner) {
  Ledger ledger;
  Ledger::Config config = createConfig();
  config.progressInterval = 1;
  ASSERT_TRUE(ledger.init(config).isOk());

  uint64_t calls = 0;
  ledger.setMiningProgressCallback([&calls](uint64_t) { ++calls; });
  auto mined = ledger.minePendingTransactions("Miner1");
  ASSERT_TRUE(mined.isOk());
  EXPECT_EQ(calls, mined->block.nonce + 1);
}

TEST(LedgerConfigTest, JsonRoundTrip) {
  Ledger::Config config;
  config.difficulty = 5;
  config.miningReward = 12.5;
  config.strictTransactions = true;
  config.minerThreads = 3;
  config.progressInterval = 250;

  Ledger::Config parsed;
  ASSERT_TRUE(parsed.ltsFromJson(config.ltsToJson()).isOk());
  EXPECT_EQ(parsed.difficulty, 5u);
  EXPECT_DOUBLE_EQ(parsed.miningReward, 12.5);
  EXPECT_TRUE(parsed.strictTransactions);
  EXPECT_EQ(parsed.minerThreads, 3u);
  EXPECT_EQ(parsed.progressInterval, 250u);
}
