#include "MiningService.h"

#include <thread>

namespace pwl {

MiningService::MiningService(Node &node) : Service("mining_service"), node_(node) {
  redirectLogger(node_.log().getFullName());
}

MiningService::~MiningService() { stop(); }

MiningService::Roe<void> MiningService::onStart() {
  auto tip = node_.getTip();
  if (!tip) {
    return Error(E_ON_START, tip.error().message);
  }
  if (tip.value().empty()) {
    return Error(E_ON_START, "Chain has no genesis block");
  }
  return {};
}

void MiningService::onStopRequested() { node_.cancelMining(); }

void MiningService::runLoop() {
  log().info << "Mining loop started";

  while (!isStopSet()) {
    if (!node_.hasPending()) {
      std::this_thread::sleep_for(idleInterval_);
      continue;
    }

    try {
      auto mined = node_.mine();
      if (mined) {
        ++minedCount_;
        log().info << "Mined block " << mined.value().blockId << " with "
                   << mined.value().block.getData().size() << " transactions";
        continue;
      }
      switch (mined.error().code) {
      case Node::E_CANCELLED:
        log().info << "Mining cancelled";
        break;
      case Node::E_EMPTY_POOL:
        break;
      default:
        log().error << "Mining failed: " << mined.error().message;
        std::this_thread::sleep_for(idleInterval_ * 10);
        break;
      }
    } catch (const std::exception &e) {
      log().error << "Exception in mining loop: " << e.what();
      std::this_thread::sleep_for(idleInterval_ * 10);
    }
  }

  log().info << "Mining loop stopped";
}

} // namespace pwl
