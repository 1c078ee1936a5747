// SusRes-Prod headers
#include "core/ControlService.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/NotificationManager.hpp"
#include "core/SuspendCoordinator.hpp"

// SusRes-Fake headers
#include "FakeMessageChannel.hpp"
#include "FakePlatform.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace susres::test {

  using core::ControlService;
  using core::SuspendCoordinator;
  using core::SuspendOrder;
  using core::SuspendOutcome;
  using core::SuspendStatus;
  using protocols::DenyReason;
  using ::testing::StartsWith;

  class ControlServiceTest : public ::testing::Test {
  protected:
    void SetUp() override {
      net = std::make_shared<FakeNetwork>(&clock);
      slot = std::make_shared<FakeTokenSlot>();
      gateway = std::make_shared<FakePowerGateway>(&net->timeline, slot);

      core::SuspendConfig cfg;
      cfg.ackTimeout = std::chrono::milliseconds{ 50 };
      cfg.options = { false, false, false };

      auto errorMonitor = std::make_shared<core::ErrorMonitor>();
      auto notifier = std::make_unique<core::NotificationManager>(
          errorMonitor,
          [n = net](const std::string&) { return std::make_unique<FakeMessageChannel>(n); },
          clock.fn());
      coord = std::make_unique<SuspendCoordinator>(
          cfg, core::Platform{ std::make_shared<FakeEntropySource>(), slot, gateway, nullptr },
          std::move(notifier), errorMonitor, std::make_shared<core::Logger>());
      coord->initialize();
      service = std::make_unique<ControlService>(*coord);
    }

    FakeClock clock;
    std::shared_ptr<FakeNetwork> net;
    std::shared_ptr<FakeTokenSlot> slot;
    std::shared_ptr<FakePowerGateway> gateway;
    std::unique_ptr<SuspendCoordinator> coord;
    std::unique_ptr<ControlService> service;
  };

  TEST_F(ControlServiceTest, registerRepliesWithRegistrationId) {
    EXPECT_EQ(service->handle("REGISTER net /run/net 4\r\n"), "OK 1");
    EXPECT_EQ(service->handle("REGISTER gfx /run/gfx 5 early"), "OK 2");
    EXPECT_EQ(service->handle("REGISTER net /run/net2 4 last"), "OK 1");

    auto gfx = coord->registry().find("gfx");
    ASSERT_TRUE(gfx);
    EXPECT_EQ(gfx->order, SuspendOrder::Early);
    EXPECT_EQ(coord->registry().find("net")->address, "/run/net2");
  }

  TEST_F(ControlServiceTest, registerRejectsBadArguments) {
    EXPECT_THAT(service->handle("REGISTER net /run/net"), StartsWith("ERR usage"));
    EXPECT_THAT(service->handle("REGISTER net /run/net four"), StartsWith("ERR bad tag"));
    EXPECT_THAT(service->handle("REGISTER net /run/net 4 soonish"), StartsWith("ERR unknown order"));
    EXPECT_TRUE(coord->registry().empty());
  }

  TEST_F(ControlServiceTest, suspendReportsTheResumedEpoch) {
    service->handle("REGISTER a /run/a 1");
    EXPECT_EQ(service->handle("SUSPEND"), "OK 1");
    EXPECT_EQ(service->handle("CLEAN"), "OK 1 1");
    EXPECT_EQ(service->handle("STATE"), "OK Idle");
  }

  TEST_F(ControlServiceTest, holdAndReleaseGateTheSuspend) {
    service->handle("REGISTER a /run/a 1");
    EXPECT_EQ(service->handle("HOLD a"), "OK");
    EXPECT_EQ(service->handle("SUSPEND"), "DENIED a vetoed");
    EXPECT_EQ(service->handle("RELEASE a"), "OK");
    EXPECT_EQ(service->handle("SUSPEND"), "OK 1");
  }

  TEST_F(ControlServiceTest, holdByUnknownIdentityIsAnError) {
    EXPECT_THAT(service->handle("HOLD ghost"), StartsWith("ERR"));
  }

  TEST_F(ControlServiceTest, unregisterIsAlwaysOk) {
    service->handle("REGISTER a /run/a 1");
    EXPECT_EQ(service->handle("UNREGISTER a"), "OK");
    EXPECT_EQ(service->handle("UNREGISTER a"), "OK");
    EXPECT_TRUE(coord->registry().empty());
  }

  TEST_F(ControlServiceTest, denyAndTimeoutReplies) {
    net->peer("/run/b").respond = FakeNetwork::deny(DenyReason::CriticalOperation);
    service->handle("REGISTER b /run/b 2");
    EXPECT_EQ(service->handle("SUSPEND"), "DENIED b critical-operation");

    net->peer("/run/b").respond = FakeNetwork::silent();
    EXPECT_EQ(service->handle("SUSPEND"), "TIMEOUT b");
  }

  TEST_F(ControlServiceTest, hardwareFailureReply) {
    gateway->wake = FakePowerGateway::Wake::Fails;
    EXPECT_EQ(service->handle("SUSPEND"), "HWFAIL");
    EXPECT_EQ(service->handle("CLEAN"), "OK 0 0");
  }

  TEST_F(ControlServiceTest, registrationDuringACycleIsBusy) {
    std::string nested;
    net->peer("/run/a").respond = [&](const protocols::Notification& n) -> std::optional<std::string> {
      if (n.phase != protocols::Phase::Prepare)
        return std::nullopt;
      nested = service->handle("REGISTER late /run/late 9");
      return protocols::Ack::ready(n.arg).toWire();
    };
    service->handle("REGISTER a /run/a 1");

    EXPECT_EQ(service->handle("SUSPEND"), "OK 1");
    EXPECT_EQ(nested, "BUSY");
  }

  TEST_F(ControlServiceTest, unknownOrEmptyRequests) {
    EXPECT_EQ(service->handle(""), "ERR empty request");
    EXPECT_THAT(service->handle("REBOOT"), StartsWith("ERR unknown request"));
    EXPECT_THAT(service->handle("SUSPEND now"), StartsWith("ERR unknown request"));
  }

  TEST(ControlServiceFormat, everyOutcomeHasAReply) {
    SuspendOutcome o;
    o.status = SuspendStatus::Busy;
    EXPECT_EQ(ControlService::formatOutcome(o), "BUSY");
    o.status = SuspendStatus::SwapFailure;
    EXPECT_EQ(ControlService::formatOutcome(o), "SWAPFAIL");
    o.status = SuspendStatus::TokenMismatch;
    EXPECT_EQ(ControlService::formatOutcome(o), "ERR TokenMismatch");
    o.status = SuspendStatus::RestoreFailure;
    EXPECT_EQ(ControlService::formatOutcome(o), "ERR RestoreFailure");
    o.status = SuspendStatus::TokenFailure;
    EXPECT_EQ(ControlService::formatOutcome(o), "ERR TokenFailure");
  }

} // namespace susres::test
