#pragma once

#include "Node.h"
#include "Service.h"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace pwl {

/**
 * Background worker that mines the node's pending pool whenever it is not
 * empty. Stopping the service cancels the search in progress.
 */
class MiningService : public Service {
public:
  explicit MiningService(Node &node);
  ~MiningService() override;

  uint64_t getMinedCount() const { return minedCount_; }
  void setIdleInterval(std::chrono::milliseconds interval) { idleInterval_ = interval; }

protected:
  Roe<void> onStart() override;
  void onStopRequested() override;
  void runLoop() override;

private:
  Node &node_;
  std::atomic<uint64_t> minedCount_{ 0 };
  std::chrono::milliseconds idleInterval_{ 100 };
};

} // namespace pwl
