#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace susres::core {

  /**
 * @class ErrorMonitor
 * @brief Components call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique message.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the escalation sink doesn’t get spammed.
 * * Suspicious wake events land here, so messages carry the epoch or cycle id.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault (the daemon logs it as an error).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of distinct failures seen since construction.
    std::size_t distinctFailures() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace susres::core
