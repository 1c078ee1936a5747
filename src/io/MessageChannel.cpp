/* @file MessageChannel.cpp
 * @brief IO abstraction layer that wraps a Unix stream socket - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// SusRes headers
#include "io/MessageChannel.hpp"

using namespace susres::io;

MessageChannel::~MessageChannel() { close(); }

MessageChannel::MessageChannel(MessageChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

MessageChannel& MessageChannel::operator=(MessageChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool MessageChannel::open(const std::string& address) {
  close();

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (address.empty() || address.size() >= sizeof(addr.sun_path)) {
    std::cerr << "Error: socket path '" << address << "' is empty or too long\n";
    return false;
  }
  std::memcpy(addr.sun_path, address.c_str(), address.size() + 1);

  fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from socket: " << strerror(errno) << "\n";
    return false;
  }

  // connect blocking (local sockets answer immediately), then switch to non-blocking
  if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    std::cerr << "Error " << errno << " from connect(" << address << "): " << strerror(errno)
              << "\n";
    close();
    return false;
  }

  int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags == -1 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == -1) {
    std::cerr << "Error " << errno << " from fcntl: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool MessageChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += written;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      ::poll(&pfd, 1, 10);
      continue;
    } else {
      std::cerr << "Error: " << errno << " from send: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// MessageChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> MessageChannel::readLine(std::chrono::milliseconds timeout) {
  auto takeLine = [this]() -> std::optional<std::string> {
    if (auto pos = rx_buffer_.find("\r\n"); pos != std::string::npos) {
      std::string line = rx_buffer_.substr(0, pos);
      rx_buffer_.erase(0, pos + 2); // remove line + CRLF
      return line;
    }
    return std::nullopt;
  };

  // a previous read may already hold a complete line
  if (auto line = takeLine())
    return line;

  if (fd_ < 0)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, n);
      } else if (n == 0) { // EOF / peer gone
        close();
        return takeLine();
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    } else if (pfd.revents & (POLLERR | POLLNVAL)) {
      close();
      return std::nullopt;
    }
  }
  return std::nullopt; // timeout/partial
}

void MessageChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
