#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace hc {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &
getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tmLocal{};
  localtime_r(&time, &tmLocal);
  std::stringstream ss;
  ss << std::put_time(&tmLocal, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

void ConsoleHandler::emit(Level level, const std::string & /*loggerName*/,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::WARNING) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string & /*loggerName*/,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  parts.push_back(name_);
  auto spCurrent = getParent();
  while (spCurrent && !spCurrent->getName().empty()) {
    parts.push_back(spCurrent->getName());
    spCurrent = spCurrent->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (it->empty()) {
      continue;
    }
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::setLevel(Level level) {
  level_ = level;
  isLevelSet_ = true;
}

Level LoggerNode::getLevel() const {
  if (isLevelSet_) {
    return level_;
  }
  auto spParent = getParent();
  return spParent ? spParent->getLevel() : level_;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::addChild(std::shared_ptr<LoggerNode> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  spChildren_.push_back(child);
}

std::vector<std::shared_ptr<LoggerNode>> LoggerNode::getChildren() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spChildren_;
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::string originName = getFullName();
  std::string formatted = formatMessage(level, originName, message);

  // Walk up the tree while propagation is enabled
  LoggerNode *pNode = this;
  std::shared_ptr<LoggerNode> spHold;
  while (pNode) {
    pNode->emitToHandlers(level, originName, formatted);
    if (!pNode->getPropagate()) {
      break;
    }
    spHold = pNode->getParent();
    pNode = spHold.get();
  }
}

void LoggerNode::emitToHandlers(Level level, const std::string &originName,
                                const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, originName, formatted);
  }
}

std::string LoggerNode::formatMessage(Level level,
                                      const std::string &originName,
                                      const std::string &message) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(spNode) {}

// Proxies must point at this instance, not the source
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

Logger Logger::getParent() const {
  return Logger(spNode_ ? spNode_->getParent() : nullptr);
}

std::vector<Logger> Logger::getChildren() const {
  std::vector<Logger> result;
  if (!spNode_) {
    return result;
  }
  for (const auto &spChild : spNode_->getChildren()) {
    result.push_back(Logger(spChild));
  }
  return result;
}

// ========== Global logger management ==========

namespace {

// Caller holds the registry mutex
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &fullName) {
  auto &registry = getLoggerRegistry();
  auto it = registry.find(fullName);
  if (it != registry.end()) {
    return it->second;
  }

  if (fullName.empty()) {
    auto spRoot = std::make_shared<LoggerNode>("");
    spRoot->setLevel(Level::INFO);
    spRoot->addHandler(std::make_shared<ConsoleHandler>());
    registry[""] = spRoot;
    return spRoot;
  }

  std::string nodeName = fullName;
  std::string parentPath;
  auto lastDot = fullName.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = fullName.substr(0, lastDot);
    nodeName = fullName.substr(lastDot + 1);
  }

  auto spParent = getOrCreateNode(parentPath);
  auto spNode = std::make_shared<LoggerNode>(nodeName);
  spNode->setParent(spParent);
  spParent->addChild(spNode);
  registry[fullName] = spNode;
  return spNode;
}

} // namespace

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

Level getLevel() { return getRootLogger().getLevel(); }

void setLevel(Level level) { getRootLogger().setLevel(level); }

} // namespace logging
} // namespace hc
