#include "../ledger/Ledger.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

namespace {
hc::Ledger *g_ledger = nullptr;

void signalHandler(int signal) {
  if (signal == SIGINT && g_ledger) {
    g_ledger->cancelMining();
  }
}

// Ctrl+C cancels mining while a ledger is set, default action otherwise
void setSignalLedger(hc::Ledger *pLedger) {
  g_ledger = pLedger;
  std::signal(SIGINT, pLedger ? signalHandler : SIG_DFL);
}

struct RunOptions {
  bool jsonOutput{ false };
  bool tamper{ true };
};

void printTransaction(const hc::Transaction &tx) {
  std::cout << "    " << tx.sender << " -> " << tx.receiver << ": "
            << std::fixed << std::setprecision(2) << tx.amount << "\n";
}

void printBlock(const hc::ChainNode &node) {
  const hc::Block &block = node.block;
  std::cout << "Block #" << block.index << "\n";
  std::cout << "  Timestamp:     "
            << hc::utl::formatTimestampLocal(block.timestamp) << "\n";
  std::cout << "  Previous Hash: " << block.previousHash << "\n";
  std::cout << "  Hash:          " << node.hash << "\n";
  std::cout << "  Nonce:         " << block.nonce << "\n";
  std::cout << "  Transactions:  " << block.transactions.size() << "\n";
  for (const auto &tx : block.transactions) {
    printTransaction(tx);
  }
  std::cout << "\n";
}

void printChain(const hc::Ledger &ledger, const RunOptions &options) {
  auto chain = ledger.getChain();
  if (options.jsonOutput) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto &node : chain) {
      j.push_back(node.toJson());
    }
    std::cout << j.dump(2) << "\n";
    return;
  }

  std::cout << "=== Blockchain ===\n\n";
  for (const auto &node : chain) {
    printBlock(node);
  }
}

void printBalances(const hc::Ledger &ledger,
                   const std::vector<std::string> &addresses) {
  std::cout << "=== Balances ===\n";
  for (const auto &address : addresses) {
    std::cout << "  " << std::left << std::setw(10) << address << std::right
              << std::fixed << std::setprecision(2)
              << ledger.getBalance(address) << "\n";
  }
  std::cout << "\n";
}

void printValidation(const hc::Ledger &ledger) {
  auto result = ledger.validate();
  std::cout << "Chain valid: " << (result.isValid() ? "yes" : "no");
  if (!result.isValid()) {
    std::cout << " (" << result << ")";
  }
  std::cout << "\n\n";
}

bool addTransactions(
    hc::Ledger &ledger,
    const std::vector<std::tuple<std::string, std::string, double>> &txes) {
  for (const auto &entry : txes) {
    auto result = ledger.addTransaction(std::get<0>(entry), std::get<1>(entry),
                                        std::get<2>(entry));
    if (!result) {
      std::cerr << "Error: Failed to add transaction: "
                << result.error().message << std::endl;
      return false;
    }
  }
  return true;
}

bool mineBlock(hc::Ledger &ledger, const std::string &minerAddress) {
  std::cout << "Mining block " << ledger.getSize() << " for " << minerAddress
            << "...\n";
  auto result = ledger.minePendingTransactions(minerAddress);
  if (!result) {
    std::cerr << "Error: " << result.error().message << std::endl;
    return false;
  }
  std::cout << "Block mined: " << result->hash << " (nonce "
            << result->block.nonce << ")\n\n";
  return true;
}

int runDemo(const hc::Ledger::Config &config, const RunOptions &options) {
  auto logger = hc::logging::getLogger("hc");

  hc::Ledger ledger;
  ledger.redirectLogger("hc.ledger");
  ledger.setMiningProgressCallback([](uint64_t attempts) {
    std::cout << "  ... " << attempts << " hashes tried" << std::endl;
  });

  setSignalLedger(&ledger);

  std::cout << "Creating ledger (difficulty " << config.difficulty
            << ", reward " << config.miningReward << ")\n\n";
  auto initResult = ledger.init(config);
  if (!initResult) {
    setSignalLedger(nullptr);
    std::cerr << "Error: Failed to initialize ledger: "
              << initResult.error().message << std::endl;
    return 1;
  }

  if (!addTransactions(ledger, { { "Alice", "Bob", 50 },
                                 { "Bob", "Charlie", 25 } }) ||
      !mineBlock(ledger, "Miner1") ||
      !addTransactions(ledger, { { "Charlie", "Alice", 10 },
                                 { "Alice", "Miner1", 5 } }) ||
      !mineBlock(ledger, "Miner1")) {
    setSignalLedger(nullptr);
    return 1;
  }
  setSignalLedger(nullptr);

  printChain(ledger, options);
  printBalances(ledger, { "Alice", "Bob", "Charlie", "Miner1" });
  printValidation(ledger);

  if (options.tamper) {
    std::cout << "Tampering with block 1: first amount set to 1000\n";
    auto edit = ledger.editBlock(1);
    if (!edit) {
      std::cerr << "Error: " << edit.error().message << std::endl;
      return 1;
    }
    hc::ChainNode *pNode = edit.value();
    if (pNode->block.transactions.empty()) {
      std::cerr << "Error: Block 1 has no transactions" << std::endl;
      return 1;
    }
    pNode->block.transactions[0].amount = 1000;
    printValidation(ledger);
  }

  logger.info << "Demo finished";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"hashchain - In-memory proof-of-work ledger demo"};

  std::string configFile;
  app.add_option("-c,--config", configFile, "JSON configuration file");

  hc::Ledger::Config cliConfig;
  app.add_option("-d,--difficulty", cliConfig.difficulty,
                 "Leading zero hex digits required in block hashes (default: 4)");
  app.add_option("-r,--reward", cliConfig.miningReward,
                 "Mining reward per block (default: 100)");
  app.add_option("-t,--threads", cliConfig.minerThreads,
                 "Number of mining threads (default: 1)")
      ->check(CLI::PositiveNumber);

  bool strictMode = false;
  app.add_flag("--strict", strictMode, "Reject malformed transactions");

  RunOptions options;
  app.add_flag("--json", options.jsonOutput, "Print the chain as JSON");
  bool noTamper = false;
  app.add_flag("--no-tamper", noTamper,
               "Skip the tampering step at the end of the demo");

  bool debugMode = false;
  app.add_flag("--debug", debugMode,
               "Enable debug logging (default: warning level)");
  std::string logFile;
  app.add_option("--log-file", logFile, "Also write log messages to this file");

  app.footer("Example:\n"
             "  hashchain -d 3 -t 4 [--debug]\n"
             "\n"
             "Command line options take precedence over the configuration "
             "file.\n");

  CLI11_PARSE(app, argc, argv);

  auto logger = hc::logging::getRootLogger();
  hc::logging::Level logLevel =
      debugMode ? hc::logging::Level::DEBUG : hc::logging::Level::WARNING;
  logger.setLevel(logLevel);
  if (!logFile.empty()) {
    try {
      logger.addFileHandler(logFile, logLevel);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
  }
  logger.info << "Logging level set to " << (debugMode ? "DEBUG" : "WARNING");

  hc::Ledger::Config config;
  if (!configFile.empty()) {
    auto jsonResult = hc::utl::loadJsonFile(configFile);
    if (!jsonResult) {
      std::cerr << "Error: " << jsonResult.error().message << std::endl;
      return 1;
    }

    auto parseResult = config.ltsFromJson(jsonResult.value());
    if (!parseResult) {
      std::cerr << "Error: " << configFile << ": "
                << parseResult.error().message << std::endl;
      return 1;
    }
  }

  // Options given on the command line replace the file values
  nlohmann::json overrides = nlohmann::json::object();
  if (app.count("--difficulty") > 0) {
    overrides["difficulty"] = cliConfig.difficulty;
  }
  if (app.count("--reward") > 0) {
    overrides["miningReward"] = cliConfig.miningReward;
  }
  if (app.count("--threads") > 0) {
    overrides["minerThreads"] = cliConfig.minerThreads;
  }
  if (strictMode) {
    overrides["strictTransactions"] = true;
  }
  auto overrideResult = config.ltsFromJson(overrides);
  if (!overrideResult) {
    std::cerr << "Error: " << overrideResult.error().message << std::endl;
    return 1;
  }
  options.tamper = !noTamper;

  return runDemo(config, options);
}
