/* @file EntropySource.cpp
 * @brief character-device entropy reader
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
#include "io/EntropySource.hpp"

using namespace susres::io;

bool DevRandomSource::fill(std::uint8_t* out, std::size_t len) {
  int fd = ::open(device_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    std::cerr << "Error " << errno << " opening " << device_ << ": " << strerror(errno) << "\n";
    return false;
  }

  std::size_t total = 0;
  while (total < len) {
    ssize_t n = ::read(fd, out + total, len - total);
    if (n > 0) {
      total += n;
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      std::cerr << "Error: short read from " << device_ << ": " << strerror(errno) << "\n";
      break;
    }
  }

  ::close(fd);
  return total == len;
}
