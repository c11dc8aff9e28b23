#ifndef HASHCHAIN_BALANCE_H
#define HASHCHAIN_BALANCE_H

#include "Block.h"

#include <map>
#include <string>
#include <vector>

namespace hc {

/**
 * Net amount received by address over the whole chain. Outgoing amounts are
 * subtracted without any sufficiency check, so the result may be negative.
 */
double calculateBalance(const std::vector<ChainNode> &chain,
                        const std::string &address);

// Balances of every address appearing in the chain, reward sender included
std::map<std::string, double>
calculateBalances(const std::vector<ChainNode> &chain);

} // namespace hc

#endif // HASHCHAIN_BALANCE_H
