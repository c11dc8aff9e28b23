#ifndef HASHCHAIN_MINER_H
#define HASHCHAIN_MINER_H

#include "Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace hc {

/**
 * Miner - Proof-of-work nonce search
 *
 * Turns a draft block into a mined ChainNode by finding the smallest nonce,
 * at or above the draft's nonce, whose block hash starts with
 * draft.difficulty zero hex digits.
 *
 * Design:
 * - With one thread the nonce space is scanned in order in the caller's
 *   thread
 * - With n threads, worker k scans start+k, start+k+n, ... and a shared
 *   lowest-found bound stops workers once only larger nonces remain, so the
 *   result is the same nonce the sequential scan finds
 * - The stop flag is checked before every hash; a stopped search reports
 *   E_CANCELLED and getResumeNonce() tells where to pick it up again
 */
class Miner : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INPUT = 1;     // Unsatisfiable difficulty
  constexpr static int32_t E_CANCELLED = 2; // Stop was requested
  constexpr static int32_t E_EXHAUSTED = 3; // No nonce left to try

  // Called with the total number of hashes computed so far. In parallel
  // mode it runs on the worker threads.
  using ProgressCallback = std::function<void(uint64_t attempts)>;

  struct Config {
    uint32_t nThreads{ 1 };
    uint64_t progressInterval{ 10000 }; // 0 disables progress reports
  };

  struct Result {
    ChainNode node;
    uint64_t attempts{ 0 };
  };

  Miner();
  ~Miner() override = default;

  const Config &getConfig() const { return config_; }
  void setConfig(const Config &config) { config_ = config; }
  void setProgressCallback(ProgressCallback callback) {
    progressCallback_ = std::move(callback);
  }

  bool isStopSet() const { return isStopSet_; }
  void setStop(bool value) { isStopSet_ = value; }

  // Lowest nonce not yet tried by the last cancelled search
  uint64_t getResumeNonce() const { return resumeNonce_; }

  Roe<Result> mine(const Block &draft);

private:
  // Longest satisfiable target: a SHA-256 digest has 64 hex digits
  constexpr static uint32_t MAX_DIFFICULTY = 64;
  constexpr static uint64_t NONE_FOUND = UINT64_MAX;

  struct SearchResult {
    bool isFound{ false };
    bool isStopped{ false };
    uint64_t nonce{ 0 };
    std::string hash;
    uint64_t nextNonce{ 0 }; // Lowest nonce of this stride left untried
  };

  SearchResult searchStride(Block block, uint64_t start, uint64_t stride,
                            std::atomic<uint64_t> &bestNonce);
  void countAttempt();

  Config config_;
  ProgressCallback progressCallback_;
  std::atomic<bool> isStopSet_{ false };
  std::atomic<uint64_t> attempts_{ 0 };
  uint64_t resumeNonce_{ 0 };
};

} // namespace hc

#endif // HASHCHAIN_MINER_H
