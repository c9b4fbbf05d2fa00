#ifndef POWLEDGER_SERVICE_H
#define POWLEDGER_SERVICE_H

#include "Module.h"
#include "ResultOrError.hpp"

#include <atomic>
#include <thread>

namespace pwl {

/**
 * Base class for components that run in a dedicated thread.
 *
 * Derived classes implement runLoop(), which executes either in the service
 * thread (start()) or in the caller thread (run()). runLoop() must return
 * soon after isStopSet() becomes true.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_RUNNING = 1;  // Already running
  constexpr static int32_t E_ON_START = 2; // onStart() refused to start

  explicit Service(const std::string &name);

  /**
   * Derived classes must call stop() in their own destructor; by the time
   * this one runs their runLoop() can no longer be executed safely.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return !isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  virtual void runLoop() = 0;
  virtual Roe<void> onStart() { return {}; }
  // Called by stop() after the stop flag is set, before joining the thread
  virtual void onStopRequested() {}
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ true };
  std::thread thread_;
};

} // namespace pwl

#endif // POWLEDGER_SERVICE_H
