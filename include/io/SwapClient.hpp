#pragma once
/** @file  SwapClient.hpp
 *  @brief Flush/restore contract with the swap server.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>

#include "io/MessageChannel.hpp"

namespace susres {
  namespace io {

    class SwapClient {
    public:
      virtual ~SwapClient() = default;

      /// Writes dirty pages out; true only once everything is durable.
      virtual bool flush() = 0;
      /// Brings swapped state back; must finish before any resume notification.
      virtual bool restore() = 0;
    };

    /**
 * @class ChannelSwapClient
 * @brief Sends `FLUSH` / `RESTORE` to the swap server and expects `OK`.
 *
 *  * Connects lazily and reconnects after a failed round-trip.
 */
    class ChannelSwapClient : public SwapClient {
    public:
      ChannelSwapClient(std::unique_ptr<MessageChannel> channel, std::string address,
                        std::chrono::milliseconds timeout);

      bool flush() override { return roundTrip("FLUSH"); }
      bool restore() override { return roundTrip("RESTORE"); }

    private:
      bool roundTrip(const std::string& request);

      std::unique_ptr<MessageChannel> channel_;
      std::string address_;
      std::chrono::milliseconds timeout_;
    };

  } // namespace io
} // namespace susres
