#ifndef POWLEDGER_MODULE_H
#define POWLEDGER_MODULE_H

#include "Logger.h"

#include <string>

namespace pwl {

/**
 * Base class for components that log.
 * Each module owns a named logger that can be attached under a parent
 * logger, so a node's parts show up as "node.miner", "node.store" etc.
 */
class Module {
public:
  /**
   * @param name Logger name for this module (e.g. "miner")
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Attach this module's logger under another logger
   * @param targetLoggerName Name of the parent logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  logging::Logger &log() const { return logger_; }

private:
  mutable logging::Logger logger_;
};

} // namespace pwl

#endif // POWLEDGER_MODULE_H
