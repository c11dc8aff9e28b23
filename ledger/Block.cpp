#include "Block.h"
#include "../lib/Serialize.hpp"

#include <sstream>

namespace hc {

std::string Block::ltsToString() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar & CURRENT_VERSION & *this;
  return oss.str();
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["previousHash"] = previousHash;
  j["nonce"] = nonce;
  j["difficulty"] = difficulty;
  nlohmann::json txArray = nlohmann::json::array();
  for (const auto &tx : transactions) {
    txArray.push_back(tx.toJson());
  }
  j["transactions"] = txArray;
  return j;
}

nlohmann::json ChainNode::toJson() const {
  nlohmann::json j = block.toJson();
  j["hash"] = hash;
  return j;
}

} // namespace hc
