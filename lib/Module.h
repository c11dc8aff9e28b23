#ifndef HASHCHAIN_MODULE_H
#define HASHCHAIN_MODULE_H

#include "Logger.h"
#include <string>

namespace hc {

/**
 * Base class for components that need logging functionality.
 * Each module logs through its own named logger in the logger tree.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "ledger.Miner"), empty for the root logger
   */
  explicit Module(const std::string &name = "");

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Switch this module to log through another logger
   * @param targetLoggerName Dotted name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  std::unique_ptr<logging::Logger> upLogger_;
};

} // namespace hc

#endif // HASHCHAIN_MODULE_H
