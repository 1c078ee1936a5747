/* @file TokenSlot.cpp
 * @brief durable file-backed token record
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <iostream>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

// SusRes headers
#include "io/TokenSlot.hpp"

using namespace susres::io;
using susres::protocols::SuspendToken;

bool FileTokenSlot::write(const SuspendToken& token) {
  const auto record = token.toRecord();

  int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    std::cerr << "Error " << errno << " opening " << path_ << ": " << strerror(errno) << "\n";
    return false;
  }

  std::size_t total = 0;
  while (total < record.size()) {
    ssize_t n = ::write(fd, record.data() + total, record.size() - total);
    if (n > 0) {
      total += n;
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      std::cerr << "Error " << errno << " writing " << path_ << ": " << strerror(errno) << "\n";
      ::close(fd);
      return false;
    }
  }

  // durability must be established before the caller asks for power-down
  if (::fsync(fd) != 0) {
    std::cerr << "Error " << errno << " from fsync(" << path_ << "): " << strerror(errno) << "\n";
    ::close(fd);
    return false;
  }
  return ::close(fd) == 0;
}

std::optional<SuspendToken> FileTokenSlot::read() {
  int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno != ENOENT)
      std::cerr << "Error " << errno << " opening " << path_ << ": " << strerror(errno) << "\n";
    return std::nullopt;
  }

  SuspendToken::Record record{};
  std::size_t total = 0;
  while (total < record.size()) {
    ssize_t n = ::read(fd, record.data() + total, record.size() - total);
    if (n > 0) {
      total += n;
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      break; // short file or I/O error: treated as corrupted
    }
  }
  ::close(fd);

  if (total != record.size())
    return std::nullopt;
  return SuspendToken::fromRecord(record);
}
