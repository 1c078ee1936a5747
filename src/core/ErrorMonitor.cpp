/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace susres {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lk(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::distinctFailures() const {
      std::lock_guard<std::mutex> lk(mtx_);
      return seen_.size();
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lk(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // outside the lock: the sink may log, and logging may report back here
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace susres
