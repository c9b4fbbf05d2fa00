#include "Service.h"
#include <gtest/gtest.h>

#include <chrono>

namespace {

class CountingService : public pwl::Service {
public:
  CountingService() : pwl::Service("counting_service") {}
  ~CountingService() override { stop(); }

  std::atomic<int> iterations{ 0 };
  std::atomic<bool> started{ false };
  std::atomic<bool> stopped{ false };
  std::atomic<bool> stopRequested{ false };
  bool refuseStart{ false };
  int runLimit{ -1 };

protected:
  Roe<void> onStart() override {
    if (refuseStart) {
      return Error(1, "refused");
    }
    started = true;
    return {};
  }

  void onStopRequested() override { stopRequested = true; }
  void onStop() override { stopped = true; }

  void runLoop() override {
    while (!isStopSet()) {
      ++iterations;
      if (runLimit >= 0 && iterations >= runLimit) {
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
};

} // namespace

TEST(ServiceTest, StartAndStopThread) {
  CountingService service;
  EXPECT_TRUE(service.isStopSet());

  auto result = service.start();
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_TRUE(service.isRunning());
  EXPECT_TRUE(service.started);

  auto again = service.start();
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, pwl::Service::E_RUNNING);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  service.stop();
  EXPECT_TRUE(service.isStopSet());
  EXPECT_TRUE(service.stopRequested);
  EXPECT_TRUE(service.stopped);
  EXPECT_GT(service.iterations.load(), 0);
}

TEST(ServiceTest, OnStartFailurePreventsStart) {
  CountingService service;
  service.refuseStart = true;
  auto result = service.start();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, pwl::Service::E_ON_START);
  EXPECT_TRUE(service.isStopSet());
}

TEST(ServiceTest, RunExecutesInCallerThread) {
  CountingService service;
  service.runLimit = 3;
  auto result = service.run();
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(service.iterations.load(), 3);
  EXPECT_TRUE(service.stopped);
  EXPECT_TRUE(service.isStopSet());
}
