// SusRes-Prod headers
#include "core/ErrorMonitor.hpp"
#include "core/NotificationManager.hpp"
#include "core/SubscriberRegistry.hpp"
#include "protocols/Ack.hpp"
#include "protocols/Notification.hpp"

// SusRes-Fake headers
#include "FakeMessageChannel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace susres::test {

  using core::ErrorMonitor;
  using core::NotificationManager;
  using core::SubscriberEntry;
  using protocols::Ack;
  using protocols::DenyReason;
  using protocols::Notification;
  using ::testing::HasSubstr;

  class MockErrorMonitor : public ErrorMonitor {
  public:
    MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
  };

  class NotificationManagerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      net = std::make_shared<FakeNetwork>(&clock);
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();

      // Upcast to base class for NotificationManager ctor
      manager = std::make_unique<NotificationManager>(
          std::static_pointer_cast<ErrorMonitor>(errorMonitor),
          [n = net](const std::string&) { return std::make_unique<FakeMessageChannel>(n); },
          clock.fn());
    }

    SubscriberEntry entry(const std::string& id, const std::string& addr, std::uint32_t tag = 7) {
      SubscriberEntry e;
      e.identity = id;
      e.address = addr;
      e.tag = tag;
      return e;
    }

    FakeClock clock;
    std::shared_ptr<FakeNetwork> net;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<NotificationManager> manager;
  };

  TEST_F(NotificationManagerTest, sendNotification_WritesWireFormatToSubscriberAddress) {
    manager->sendNotification(entry("pg", "/run/pg"), Notification::prepare(7, 42));

    ASSERT_EQ(net->sentTo("/run/pg"), (std::vector<std::string>{ "7 PREPARE 42" }));
  }

  TEST_F(NotificationManagerTest, awaitAck_ReturnsReadyForTheCycle) {
    manager->sendNotification(entry("pg", "/run/pg"), Notification::prepare(7, 3));

    auto ack = manager->awaitAck("pg", 3, std::chrono::milliseconds{ 100 });

    ASSERT_TRUE(ack);
    EXPECT_EQ(*ack, Ack::ready(3));
  }

  TEST_F(NotificationManagerTest, awaitAck_SkipsGarbageAndStaleAcks) {
    net->peer("/run/pg").respond = [](const Notification& n) -> std::optional<std::string> {
      return "hello\r\nREADY 1\r\nDENY " + std::to_string(n.arg) + " 2\r\n";
    };
    manager->sendNotification(entry("pg", "/run/pg"), Notification::prepare(7, 9));

    auto ack = manager->awaitAck("pg", 9, std::chrono::milliseconds{ 100 });

    ASSERT_TRUE(ack);
    EXPECT_FALSE(ack->isReady());
    EXPECT_EQ(ack->reason, DenyReason::CriticalOperation);
  }

  TEST_F(NotificationManagerTest, awaitAck_TimesOutOnSilence) {
    net->peer("/run/pg").respond = FakeNetwork::silent();
    manager->sendNotification(entry("pg", "/run/pg"), Notification::prepare(7, 1));
    const auto start = clock.t;

    EXPECT_FALSE(manager->awaitAck("pg", 1, std::chrono::milliseconds{ 250 }));
    EXPECT_EQ(clock.t - start, std::chrono::milliseconds{ 250 });
  }

  TEST_F(NotificationManagerTest, awaitAck_UnknownIdentityHasNothingToRead) {
    EXPECT_FALSE(manager->awaitAck("nobody", 1, std::chrono::milliseconds{ 10 }));
  }

  TEST_F(NotificationManagerTest, unreachableSubscriber_ThrowsAndReports) {
    net->peer("/run/gone").reachable = false;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("gone unreachable"))).Times(1);

    EXPECT_THROW(manager->sendNotification(entry("gone", "/run/gone"), Notification::abort(1, 1)),
                 std::runtime_error);
  }

  TEST_F(NotificationManagerTest, writeFailure_DropsTheLinkSoTheNextSendReconnects) {
    net->peer("/run/pg").writeOk = false;
    EXPECT_THROW(manager->sendNotification(entry("pg", "/run/pg"), Notification::prepare(7, 1)),
                 std::runtime_error);

    net->peer("/run/pg").writeOk = true;
    manager->sendNotification(entry("pg", "/run/pg"), Notification::prepare(7, 2));

    EXPECT_EQ(net->opens, 2);
    EXPECT_EQ(net->sentTo("/run/pg"), (std::vector<std::string>{ "7 PREPARE 2" }));
  }

  TEST_F(NotificationManagerTest, channelIsReusedUntilTheAddressChanges) {
    manager->sendNotification(entry("pg", "/run/pg"), Notification::prepare(7, 1));
    manager->sendNotification(entry("pg", "/run/pg"), Notification::resume(7, 1));
    EXPECT_EQ(net->opens, 1);

    manager->sendNotification(entry("pg", "/run/pg2"), Notification::prepare(7, 2));
    EXPECT_EQ(net->opens, 2);

    manager->dropChannel("pg");
    manager->sendNotification(entry("pg", "/run/pg2"), Notification::prepare(7, 3));
    EXPECT_EQ(net->opens, 3);
  }

  TEST(NotificationManagerCtor, rejectsMissingCollaborators) {
    EXPECT_THROW(NotificationManager(nullptr, [](const std::string&) {
                   return std::unique_ptr<io::MessageChannel>{};
                 }),
                 std::invalid_argument);
    EXPECT_THROW(NotificationManager(std::make_shared<ErrorMonitor>(), nullptr),
                 std::invalid_argument);
  }

} // namespace susres::test
