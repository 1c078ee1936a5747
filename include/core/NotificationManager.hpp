#pragma once
/** @file  NotificationManager.hpp
 *  @brief Sequential notify / await-ack multiplexer over subscriber channels.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

// SusRes headers
#include "core/ErrorMonitor.hpp"     // NotificationManager reports unreachable peers
#include "core/SubscriberRegistry.hpp"
#include "io/MessageChannel.hpp"     // owns one channel per subscriber
#include "protocols/Ack.hpp"
#include "protocols/Notification.hpp"

namespace susres {
  namespace core {

    class NotificationManager {
    public:
      using Clock = std::function<std::chrono::steady_clock::time_point()>;

      NotificationManager(std::shared_ptr<ErrorMonitor> errMonitor, io::ChannelFactory factory,
                          Clock clock = std::chrono::steady_clock::now);
      ~NotificationManager() = default;
      //---public APIs------------------------------------------------------
      /// Throws `std::runtime_error` when the subscriber cannot be reached (dead peer).
      void sendNotification(const SubscriberEntry& entry, const protocols::Notification& n);

      /// First well-formed ack for \p cycleId within \p timeout; stale or garbled lines are skipped.
      std::optional<protocols::Ack> awaitAck(const std::string& identity, std::uint64_t cycleId,
                                             std::chrono::milliseconds timeout);

      void dropChannel(const std::string& identity);

      std::chrono::steady_clock::time_point now() const { return clock_(); }

    private:
      io::MessageChannel& channelFor(const SubscriberEntry& entry);

      struct Link {
        std::string address;
        std::unique_ptr<io::MessageChannel> channel;
      };

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      io::ChannelFactory factory_;
      Clock clock_;
      std::unordered_map<std::string, Link> links_;
    };

  } // namespace core
} // namespace susres
