#pragma once
/** @file  ControlSocket.hpp
 *  @brief Listening Unix socket on which servers register and request suspend.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

#include "io/MessageChannel.hpp"

namespace susres {
  namespace io {

    /**
 * @class ControlSocket
 * @brief Owns the listening fd and the socket file; hands out one accepted
 *        peer at a time as a MessageChannel.
 *
 *  * Non-copyable (sole owner of the listening fd and its path).
 */
    class ControlSocket {
    public:
      ControlSocket() = default;
      ~ControlSocket(); ///< close + unlink

      /** @returns false if the path cannot be bound. A stale socket file is replaced. */
      bool listen(const std::string& path);

      /** Waits up to \p timeout for a client; std::nullopt if none arrived. */
      std::optional<MessageChannel> accept(std::chrono::milliseconds timeout);

      void close();

      ControlSocket(const ControlSocket&) = delete;
      ControlSocket& operator=(const ControlSocket&) = delete;

    private:
      int fd_{ -1 };
      std::string path_;
    };

  } // namespace io
} // namespace susres
