/* @file PowerGateway.cpp
 * @brief Linux sysfs power-state gateway
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <iostream>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <sys/reboot.h>
#include <unistd.h>

// SusRes headers
#include "io/PowerGateway.hpp"

using namespace susres::io;
using susres::protocols::SuspendToken;

std::optional<WakeContext> SysfsPowerGateway::powerDown(const SuspendToken& token) {
  int fd = ::open(statePath_.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    std::cerr << "Error " << errno << " opening " << statePath_ << ": " << strerror(errno) << "\n";
    return std::nullopt;
  }

  ::sync();

  // the kernel only returns from this write once the system has woken up again
  static constexpr char kState[] = "mem";
  ssize_t n;
  do {
    n = ::write(fd, kState, sizeof(kState) - 1);
  } while (n == -1 && errno == EINTR);
  int err = errno;
  ::close(fd);

  if (n != static_cast<ssize_t>(sizeof(kState) - 1)) {
    std::cerr << "Error " << err << " entering suspend: " << strerror(err) << "\n";
    return std::nullopt;
  }
  return WakeContext{ token };
}

void SysfsPowerGateway::resetSystem(const std::optional<SuspendToken>& handoff) {
  if (!handoff_.write(handoff.value_or(SuspendToken::invalid()))) {
    std::cerr << "Error: could not write reset hand-off, rebooting without one\n";
  }
  ::sync();
  if (::reboot(RB_AUTOBOOT) != 0) {
    std::cerr << "Error " << errno << " from reboot: " << strerror(errno) << "\n";
  }
}

std::optional<SuspendToken> SysfsPowerGateway::takeBootContext() {
  auto token = handoff_.read();
  if (token && token->isValid()) {
    // consume it so a later unrelated boot cannot present it again
    if (!handoff_.write(SuspendToken::invalid()))
      std::cerr << "Error: could not clear reset hand-off at " << handoff_.path() << "\n";
    return token;
  }
  return std::nullopt;
}
