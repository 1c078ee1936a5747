#pragma once

/** @file  SuspendCoordinator.hpp
 *  @brief Public API for susres::core::SuspendCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/NotificationManager.hpp"
#include "core/SubscriberRegistry.hpp"
#include "core/SuspendConfig.hpp"
#include "core/TokenManager.hpp"
#include "io/EntropySource.hpp"
#include "io/PowerGateway.hpp"
#include "io/SwapClient.hpp"
#include "io/TokenSlot.hpp"
#include "protocols/Ack.hpp"
#include "protocols/SuspendToken.hpp"

namespace susres {
  namespace core {

    enum class PowerState : std::uint8_t { Idle, PreparingSuspend, Suspended, Resuming };

    const char* toString(PowerState s);

    enum class SuspendStatus : std::uint8_t {
      Resumed,                   ///< full cycle, lightweight resume broadcast sent
      Busy,                      ///< another cycle was in flight
      Denied,                    ///< a subscriber (or a hold) refused
      Timeout,                   ///< a subscriber did not answer in time
      TokenMismatch,             ///< untrusted wake, fell back to full re-initialisation
      RestoreFailure,            ///< swap restore failed, fell back to full re-initialisation
      HardwareTransitionFailure, ///< power-down (or test reset) did not happen
      SwapFailure,               ///< swap flush failed before power-down
      TokenFailure,              ///< no entropy, or the token could not be made durable
    };

    const char* toString(SuspendStatus s);

    /// What the caller of requestSuspend() gets back; never an exception.
    struct SuspendOutcome {
      SuspendStatus status{ SuspendStatus::Resumed };
      std::string identity; ///< failing subscriber (Denied / Timeout)
      protocols::DenyReason reason{ protocols::DenyReason::Unspecified };
      std::uint64_t epoch{ 0 }; ///< epoch minted for this cycle, 0 if none

      bool ok() const { return status == SuspendStatus::Resumed; }
    };

    /// External collaborators. `swap` may be null when the swap option is off.
    struct Platform {
      std::shared_ptr<io::EntropySource> entropy;
      std::shared_ptr<io::TokenSlot> tokenSlot;
      std::shared_ptr<io::PowerGateway> gateway;
      std::shared_ptr<io::SwapClient> swap;
    };

    /**
 * @class SuspendCoordinator
 * @brief Two-phase suspend/resume state machine.
 *
 *  Idle -> PreparingSuspend -> (Suspended) -> Resuming -> Idle.
 *
 *  * Single flow of control: every call runs to completion on the caller's
 *    thread, one subscriber round-trip at a time.
 *  * Prepare goes out in ascending registration order, resume in the exact
 *    reverse, abort in reverse to the subscribers that had said ready.
 *  * A wake whose token does not match the persisted one never resumes;
 *    it takes the cold-boot path instead.
 */
    class SuspendCoordinator {

    public:
      SuspendCoordinator(SuspendConfig config, Platform platform,
                         std::unique_ptr<NotificationManager> notifier,
                         std::shared_ptr<ErrorMonitor> errMonitor, std::shared_ptr<Logger> logger);
      ~SuspendCoordinator() = default;

      // ---- Public API ----------------------------------------------------
      /// Cold-boot entry. \p bootContext is the token the platform handed over from the last run.
      void initialize(const std::optional<protocols::SuspendToken>& bootContext = std::nullopt);

      /// Throws `std::logic_error` while a cycle is in flight.
      std::uint64_t registerSubscriber(const std::string& identity, std::string address,
                                       std::uint32_t tag,
                                       SuspendOrder order = SuspendOrder::Normal);
      bool unregisterSubscriber(const std::string& identity);

      /// Veto suspend until release(); throws `std::invalid_argument` for unknown identities.
      void hold(const std::string& identity);
      bool release(const std::string& identity);

      SuspendOutcome requestSuspend(); ///< one complete cycle, including the wake

      /// Replaces the default reinit action (a full system reset) on an untrusted wake.
      void registerReinitHandler(std::function<void()> cb) { reinitHandler_ = std::move(cb); }

      PowerState state() const { return currentState_; }
      bool wasSuspendClean() const { return clean_; }
      std::uint64_t lastResumedEpoch() const { return lastResumedEpoch_; }
      bool rebootTestValidated() const { return rebootTestValidated_; }
      const SubscriberRegistry& registry() const { return registry_; }
      std::size_t holdCount() const { return holds_.size(); }

    private:
      enum class AckState { Pending, Ready, Denied, TimedOut, DeadPeer };
      using AckRecord = std::unordered_map<std::string, AckState>;
      using OrderedView = SubscriberRegistry::OrderedView;

      std::optional<SuspendOutcome> prepare(const OrderedView& view, std::uint64_t cycleId,
                                            AckRecord& acks);
      SuspendOutcome commit(const OrderedView& participants, std::uint64_t cycleId);
      SuspendOutcome resume(const io::WakeContext& wake, const OrderedView& participants);
      SuspendOutcome rollback(const OrderedView& participants, std::uint64_t cycleId,
                              SuspendOutcome outcome);
      SuspendOutcome fallbackToColdBoot(SuspendOutcome outcome);

      void broadcastAbort(const std::vector<SubscriberEntry>& targets, std::uint64_t cycleId);
      void dropSubscriber(const std::string& identity, const std::string& why);
      void noteTimeout(const std::string& identity);
      std::chrono::milliseconds cycleBudget(std::size_t subscribers) const;

      void transitionTo(PowerState next);
      void requireIdle(const char* operation) const;
      void log(LogLevel level, const std::string& message);

      SuspendConfig config_;
      Platform platform_;
      std::unique_ptr<NotificationManager> notifier_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;

      SubscriberRegistry registry_;
      TokenManager tokens_;
      std::set<std::string> holds_;
      std::unordered_map<std::string, std::uint32_t> timeoutStreak_;
      std::function<void()> reinitHandler_{};

      PowerState currentState_{ PowerState::Idle };
      std::uint64_t cycleCounter_{ 0 };
      std::uint64_t lastResumedEpoch_{ 0 };
      bool clean_{ false };
      bool rebootTestValidated_{ false };
    };

  } // namespace core
} // namespace susres
