#pragma once
/** @file  MessageChannel.hpp
 *  @brief Non-blocking line I/O over one Unix stream socket (poll under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace susres {
  namespace io {

    /**
 * @class MessageChannel
 * @brief RAII wrapper around a single AF_UNIX socket file descriptor.
 *
 *  * Frames I/O as ASCII lines (`\r\n`).
 *  * *Non-copyable*, but move-constructible.
 *  * Virtual so the notification layer can be driven by fakes in tests.
 */

    class MessageChannel {

    public:
      //---ctr / dtr--------------------------------------------
      MessageChannel() = default;
      explicit MessageChannel(int connectedFd) : fd_(connectedFd) {}
      virtual ~MessageChannel(); // close the socket at destruction

      //---public API-------------------------------------------
      /** Connects to the socket path \p address; false if nobody listens there. */
      virtual bool open(const std::string& address);
      virtual bool writeLine(const std::string& line); // returns false on EPIPE/EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      MessageChannel(const MessageChannel&) = delete;
      MessageChannel& operator=(const MessageChannel&) = delete;

      //---mv and mv assign-------------------------------------
      MessageChannel(MessageChannel&& other) noexcept;
      MessageChannel& operator=(MessageChannel&& other) noexcept;

    private:
      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received past the last returned line
    };

    /// Hands out a fresh, unopened channel for a notification address.
    using ChannelFactory = std::function<std::unique_ptr<MessageChannel>(const std::string& address)>;

  } // namespace io
} // namespace susres
