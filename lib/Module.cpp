#include "Module.h"

namespace hc {

Module::Module(const std::string &name)
    : upLogger_(std::make_unique<logging::Logger>(logging::getLogger(name))) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  *upLogger_ = logging::getLogger(targetLoggerName);
}

logging::Logger &Module::log() const { return *upLogger_; }

} // namespace hc
