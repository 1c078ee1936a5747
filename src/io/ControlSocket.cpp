/* @file ControlSocket.cpp
 * @brief AF_UNIX listener for the control surface
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <iostream>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// SusRes headers
#include "io/ControlSocket.hpp"

using namespace susres::io;

ControlSocket::~ControlSocket() { close(); }

bool ControlSocket::listen(const std::string& path) {
  close();

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
    std::cerr << "Error: control socket path '" << path << "' is empty or too long\n";
    return false;
  }
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

  fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from socket: " << strerror(errno) << "\n";
    return false;
  }

  ::unlink(path.c_str()); // left behind by a previous run
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::listen(fd_, 8) != 0) {
    std::cerr << "Error " << errno << " binding " << path << ": " << strerror(errno) << "\n";
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  path_ = path;
  return true;
}

std::optional<MessageChannel> ControlSocket::accept(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  pollfd pfd{ fd_, POLLIN, 0 };
  int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rc <= 0) {
    if (rc == -1 && errno != EINTR)
      std::cerr << "poll: " << strerror(errno) << '\n';
    return std::nullopt;
  }

  int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
  if (client < 0) {
    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
      std::cerr << "accept: " << strerror(errno) << '\n';
    return std::nullopt;
  }
  return MessageChannel{ client };
}

void ControlSocket::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    ::unlink(path_.c_str());
  }
  fd_ = -1;
  path_.clear();
}
