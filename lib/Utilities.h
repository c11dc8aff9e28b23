#ifndef HASHCHAIN_UTILITIES_H
#define HASHCHAIN_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 * @return Current time in seconds
 */
int64_t getCurrentTime();

/**
 * Format a unix timestamp in local time ("%Y-%m-%d %H:%M:%S %Z")
 * @param unixSeconds Seconds since the epoch
 * @return Formatted time, or the plain number if formatting fails
 */
std::string formatTimestampLocal(int64_t unixSeconds);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Roe<nlohmann::json> with the parsed document or an error
 */
hc::Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Compute SHA-256 hash using the OpenSSL EVP interface
 * @param input Input string to hash
 * @return Lowercase hexadecimal string representation of the hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

} // namespace utl
} // namespace hc

#endif // HASHCHAIN_UTILITIES_H
