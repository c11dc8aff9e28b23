#include "Miner.h"
#include "Hasher.h"

#include <algorithm>
#include <future>
#include <vector>

namespace hc {

Miner::Miner() : Module("Miner") {}

void Miner::countAttempt() {
  uint64_t attempts = ++attempts_;
  if (progressCallback_ && config_.progressInterval > 0 &&
      attempts % config_.progressInterval == 0) {
    progressCallback_(attempts);
  }
}

Miner::SearchResult Miner::searchStride(Block block, uint64_t start,
                                        uint64_t stride,
                                        std::atomic<uint64_t> &bestNonce) {
  SearchResult result;
  uint64_t nonce = start;
  while (true) {
    result.nextNonce = nonce;
    // Another worker already holds a smaller nonce
    if (nonce >= bestNonce.load()) {
      return result;
    }
    if (isStopSet_) {
      result.isStopped = true;
      return result;
    }

    block.nonce = nonce;
    std::string hash = calculateHash(block);
    countAttempt();

    if (meetsDifficulty(hash, block.difficulty)) {
      result.isFound = true;
      result.nonce = nonce;
      result.hash = hash;
      uint64_t current = bestNonce.load();
      while (nonce < current &&
             !bestNonce.compare_exchange_weak(current, nonce)) {
      }
      return result;
    }

    if (NONE_FOUND - nonce <= stride) {
      // Nonce space of this stride is used up
      result.nextNonce = NONE_FOUND;
      return result;
    }
    nonce += stride;
  }
}

Miner::Roe<Miner::Result> Miner::mine(const Block &draft) {
  if (draft.difficulty > MAX_DIFFICULTY) {
    return Error(E_INPUT, "Difficulty " + std::to_string(draft.difficulty) +
                              " exceeds hash length");
  }

  const uint32_t nThreads = std::max<uint32_t>(config_.nThreads, 1);
  attempts_ = 0;
  resumeNonce_ = draft.nonce;

  log().debug << "Mining block " << draft.index << " at difficulty "
              << draft.difficulty << " from nonce " << draft.nonce << " with "
              << nThreads << " thread(s)";

  std::atomic<uint64_t> bestNonce{ NONE_FOUND };
  std::vector<SearchResult> results;
  if (nThreads == 1) {
    results.push_back(searchStride(draft, draft.nonce, 1, bestNonce));
  } else {
    std::vector<std::future<SearchResult>> futures;
    for (uint32_t k = 0; k < nThreads; ++k) {
      if (NONE_FOUND - draft.nonce <= k) {
        break;
      }
      futures.push_back(std::async(std::launch::async, &Miner::searchStride,
                                   this, draft, draft.nonce + k,
                                   static_cast<uint64_t>(nThreads),
                                   std::ref(bestNonce)));
    }
    for (auto &future : futures) {
      results.push_back(future.get());
    }
  }

  const SearchResult *pBest = nullptr;
  bool isStopped = false;
  uint64_t resumeNonce = NONE_FOUND;
  for (const auto &result : results) {
    if (result.isFound && (!pBest || result.nonce < pBest->nonce)) {
      pBest = &result;
    }
    isStopped = isStopped || result.isStopped;
    resumeNonce = std::min(resumeNonce, result.nextNonce);
  }

  // A stopped worker may not have reached nonces below the best one yet
  if (pBest && resumeNonce >= pBest->nonce) {
    Result out;
    out.node.block = draft;
    out.node.block.nonce = pBest->nonce;
    out.node.hash = pBest->hash;
    out.attempts = attempts_;
    log().info << "Block " << draft.index << " mined: nonce " << pBest->nonce
               << ", hash " << pBest->hash << " (" << out.attempts
               << " attempts)";
    return out;
  }

  resumeNonce_ = resumeNonce;
  if (isStopped) {
    log().info << "Mining of block " << draft.index
               << " cancelled, resume at nonce " << resumeNonce_;
    return Error(E_CANCELLED, "Mining cancelled");
  }
  return Error(E_EXHAUSTED, "Nonce space exhausted");
}

} // namespace hc
