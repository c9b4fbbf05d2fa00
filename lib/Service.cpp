#include "Service.h"

namespace pwl {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (thread_.joinable()) {
    isStopSet_ = true;
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_ON_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (isStopSet_ && !thread_.joinable()) {
    return;
  }

  log().info << "Stopping service";
  isStopSet_ = true;
  onStopRequested();
  if (thread_.joinable()) {
    thread_.join();
  }
  onStop();
  log().info << "Service stopped";
}

Service::Roe<void> Service::run() {
  if (!isStopSet_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_ON_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  log().info << "Service running in current thread";
  runLoop();
  isStopSet_ = true;
  onStop();
  log().info << "Service stopped (current thread)";
  return {};
}

} // namespace pwl
