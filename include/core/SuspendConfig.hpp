#pragma once
/** @file  SuspendConfig.hpp
 *  @brief Build-time options and run-time tunables of the suspend/resume manager.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace susres::core {

#ifdef SUSRES_SWAP
  inline constexpr bool kSwapDefault = true;
#else
  inline constexpr bool kSwapDefault = false;
#endif

#ifdef SUSRES_REBOOT_ON_SUSPEND_TEST
  inline constexpr bool kRebootOnSuspendTestDefault = true;
#else
  inline constexpr bool kRebootOnSuspendTestDefault = false;
#endif

#ifdef SUSRES_DEBUG_TRACE
  inline constexpr bool kDebugTraceDefault = true;
#else
  inline constexpr bool kDebugTraceDefault = false;
#endif

  /// Defaults come from the CMake options of the same name.
  struct SuspendOptions {
    bool swap{ kSwapDefault };                               ///< flush/restore via the swap server
    bool rebootOnSuspendTest{ kRebootOnSuspendTestDefault }; ///< reset instead of power-down
    bool debugTrace{ kDebugTraceDefault };                   ///< log every phase transition
  };

  struct SuspendConfig {
    std::chrono::milliseconds ackTimeout{ 1000 };    ///< per subscriber, prepare phase
    std::chrono::milliseconds cycleTimeoutCap{ 0 };  ///< 0 = sum of per-subscriber deadlines
    std::uint32_t timeoutEscalationThreshold{ 3 };   ///< consecutive timeouts before escalating
    std::string tokenSlotPath{ "/var/lib/susres/token" };
    std::string bootHandoffPath{ "/var/lib/susres/handoff" };
    std::string powerStatePath{ "/sys/power/state" };
    std::string entropyDevice{ "/dev/urandom" };
    std::string swapAddress{ "/run/susres/swap.sock" };
    std::string controlSocket{ "/run/susres/control.sock" };
    std::string logPath{ "/var/log/susres/events.csv" };
    SuspendOptions options{};

    /// Missing keys keep their defaults; wrong types or ranges throw `std::runtime_error`.
    static SuspendConfig fromJson(const nlohmann::json& j);
  };

} // namespace susres::core
