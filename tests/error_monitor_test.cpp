// SusRes-Prod headers
#include "core/ErrorMonitor.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace susres::test {

  using core::ErrorMonitor;

  TEST(ErrorMonitor, forwardsEachDistinctMessageOnce) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

    monitor.notifyFailure("wake token mismatch (epoch 4)");
    monitor.notifyFailure("wake token mismatch (epoch 4)");
    monitor.notifyFailure("subscriber net unreachable");

    EXPECT_EQ(escalated,
              (std::vector<std::string>{ "wake token mismatch (epoch 4)", "subscriber net unreachable" }));
    EXPECT_EQ(monitor.distinctFailures(), 2u);
  }

  TEST(ErrorMonitor, recordsWithoutAnEscalationSink) {
    ErrorMonitor monitor;
    monitor.notifyFailure("early fault");
    EXPECT_EQ(monitor.distinctFailures(), 1u);
  }

  TEST(ErrorMonitor, sinkMayReportBackWithoutDeadlock) {
    ErrorMonitor monitor;
    int calls = 0;
    monitor.registerEscalation([&](const std::string& m) {
      ++calls;
      if (m == "first")
        monitor.notifyFailure("second");
    });

    monitor.notifyFailure("first");

    EXPECT_EQ(calls, 2);
  }

  TEST(ErrorMonitor, concurrentReportersAreCountedOnce) {
    ErrorMonitor monitor;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
      threads.emplace_back([&monitor] {
        for (int i = 0; i < 100; ++i)
          monitor.notifyFailure("fault " + std::to_string(i % 10));
      });
    for (auto& th : threads)
      th.join();

    EXPECT_EQ(monitor.distinctFailures(), 10u);
  }

} // namespace susres::test
