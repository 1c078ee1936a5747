/* @file SuspendCoordinator.cpp
 * @brief suspend/resume cycle: prepare, commit, power transition, resume or fall back
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// SusRes headers
#include "core/SuspendCoordinator.hpp"

namespace susres {
  namespace core {

    using protocols::DenyReason;
    using protocols::Notification;
    using protocols::SuspendToken;
    using protocols::TokenOrigin;

    const char* toString(PowerState s) {
      switch (s) {
      case PowerState::Idle:
        return "Idle";
      case PowerState::PreparingSuspend:
        return "PreparingSuspend";
      case PowerState::Suspended:
        return "Suspended";
      case PowerState::Resuming:
        return "Resuming";
      default:
        return "Unknown";
      }
    }

    const char* toString(SuspendStatus s) {
      switch (s) {
      case SuspendStatus::Resumed:
        return "Resumed";
      case SuspendStatus::Busy:
        return "Busy";
      case SuspendStatus::Denied:
        return "Denied";
      case SuspendStatus::Timeout:
        return "Timeout";
      case SuspendStatus::TokenMismatch:
        return "TokenMismatch";
      case SuspendStatus::RestoreFailure:
        return "RestoreFailure";
      case SuspendStatus::HardwareTransitionFailure:
        return "HardwareTransitionFailure";
      case SuspendStatus::SwapFailure:
        return "SwapFailure";
      case SuspendStatus::TokenFailure:
        return "TokenFailure";
      default:
        return "Unknown";
      }
    }

    SuspendCoordinator::SuspendCoordinator(SuspendConfig config, Platform platform,
                                           std::unique_ptr<NotificationManager> notifier,
                                           std::shared_ptr<ErrorMonitor> errMonitor,
                                           std::shared_ptr<Logger> logger)
        : config_(std::move(config)), platform_(std::move(platform)),
          notifier_(std::move(notifier)), errorMonitor_(std::move(errMonitor)),
          logger_(std::move(logger)), tokens_(platform_.entropy, platform_.tokenSlot) {
      if (!notifier_ || !errorMonitor_ || !logger_)
        throw std::invalid_argument("[SuspendCoordinator] notifier, error monitor and logger are required");
      if (!platform_.gateway)
        throw std::invalid_argument("[SuspendCoordinator] power gateway is nullptr");
      if (config_.options.swap && !platform_.swap)
        throw std::invalid_argument("[SuspendCoordinator] swap enabled without a swap client");
    }

    //---cold boot--------------------------------------------------------------

    void SuspendCoordinator::initialize(const std::optional<SuspendToken>& bootContext) {
      requireIdle("initialize");

      clean_ = false;
      rebootTestValidated_ = false;

      auto persisted = tokens_.readBack();
      if (persisted && persisted->isValid()) {
        if (persisted->origin == TokenOrigin::RebootTest && bootContext &&
            persisted->sameBinding(*bootContext)) {
          rebootTestValidated_ = true;
          log(LogLevel::Info, "reboot-on-suspend cycle epoch " + std::to_string(persisted->epoch) +
                                  " validated, continuing as cold boot");
        } else {
          std::string msg = "[SuspendCoordinator] unexplained suspend token at cold boot (epoch " +
                            std::to_string(persisted->epoch) + ")";
          errorMonitor_->notifyFailure(msg);
          log(LogLevel::Warning, msg);
        }
      } else if (bootContext && bootContext->isValid()) {
        std::string msg = "[SuspendCoordinator] boot context without a persisted token (epoch " +
                          std::to_string(bootContext->epoch) + ")";
        errorMonitor_->notifyFailure(msg);
        log(LogLevel::Warning, msg);
      }

      if (!tokens_.invalidate())
        throw std::runtime_error("[SuspendCoordinator] cannot initialise the token slot");

      log(LogLevel::Trace, "cold boot complete, state Idle");
    }

    //---registration-----------------------------------------------------------

    std::uint64_t SuspendCoordinator::registerSubscriber(const std::string& identity,
                                                         std::string address, std::uint32_t tag,
                                                         SuspendOrder order) {
      requireIdle("register");
      auto id = registry_.registerSubscriber(identity, std::move(address), tag, order);
      log(LogLevel::Trace, "registered " + identity + " (#" + std::to_string(id) + ", " +
                               toString(order) + ")");
      return id;
    }

    bool SuspendCoordinator::unregisterSubscriber(const std::string& identity) {
      requireIdle("unregister");
      holds_.erase(identity);
      timeoutStreak_.erase(identity);
      notifier_->dropChannel(identity);
      return registry_.unregisterSubscriber(identity);
    }

    void SuspendCoordinator::hold(const std::string& identity) {
      if (!registry_.contains(identity))
        throw std::invalid_argument("[SuspendCoordinator] hold by unregistered " + identity);
      holds_.insert(identity);
    }

    bool SuspendCoordinator::release(const std::string& identity) {
      return holds_.erase(identity) != 0;
    }

    //---the cycle--------------------------------------------------------------

    SuspendOutcome SuspendCoordinator::requestSuspend() {
      if (currentState_ != PowerState::Idle) {
        log(LogLevel::Warning,
            std::string("suspend request rejected, cycle in progress (") + toString(currentState_) + ")");
        return { SuspendStatus::Busy, "", DenyReason::Busy, 0 };
      }

      if (!holds_.empty()) {
        const std::string& holder = *holds_.begin();
        log(LogLevel::Info, "suspend refused, held by " + holder);
        return { SuspendStatus::Denied, holder, DenyReason::Vetoed, 0 };
      }

      const std::uint64_t cycleId = ++cycleCounter_;
      transitionTo(PowerState::PreparingSuspend);

      const OrderedView view = registry_.orderedView();
      OrderedView participants;
      {
        AckRecord acks;
        for (const auto& entry : view.suspend)
          acks.emplace(entry.identity, AckState::Pending);

        if (auto failure = prepare(view, cycleId, acks)) {
          std::vector<SubscriberEntry> targets;
          for (const auto& entry : view.suspend) {
            // a timed-out subscriber may still be half-way through preparing: best effort
            auto st = acks[entry.identity];
            if (st == AckState::Ready || st == AckState::TimedOut)
              targets.push_back(entry);
          }
          std::reverse(targets.begin(), targets.end());
          broadcastAbort(targets, cycleId);

          log(LogLevel::Warning, std::string("cycle ") + std::to_string(cycleId) + " aborted: " +
                                     toString(failure->status) + " " + failure->identity + " (" +
                                     toString(failure->reason) + ")");
          transitionTo(PowerState::Idle);
          return *failure;
        }

        for (const auto& entry : view.suspend) {
          if (acks[entry.identity] == AckState::Ready)
            participants.suspend.push_back(entry);
        }
      }

      return commit(participants, cycleId);
    }

    std::optional<SuspendOutcome> SuspendCoordinator::prepare(const OrderedView& view,
                                                              std::uint64_t cycleId,
                                                              AckRecord& acks) {
      const auto cycleDeadline = notifier_->now() + cycleBudget(view.suspend.size());

      for (const auto& entry : view.suspend) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(cycleDeadline -
                                                                          notifier_->now());
        if (left.count() <= 0) {
          log(LogLevel::Warning, "cycle deadline spent before " + entry.identity + " was asked");
          return SuspendOutcome{ SuspendStatus::Timeout, entry.identity, DenyReason::Timeout, 0 };
        }

        try {
          notifier_->sendNotification(entry, Notification::prepare(entry.tag, cycleId));
        } catch (const std::runtime_error& e) {
          acks[entry.identity] = AckState::DeadPeer;
          dropSubscriber(entry.identity, e.what());
          continue;
        }

        auto ack = notifier_->awaitAck(entry.identity, cycleId, std::min(config_.ackTimeout, left));
        if (!ack) {
          acks[entry.identity] = AckState::TimedOut;
          noteTimeout(entry.identity);
          return SuspendOutcome{ SuspendStatus::Timeout, entry.identity, DenyReason::Timeout, 0 };
        }

        timeoutStreak_.erase(entry.identity);
        if (!ack->isReady()) {
          acks[entry.identity] = AckState::Denied;
          return SuspendOutcome{ SuspendStatus::Denied, entry.identity, ack->reason, 0 };
        }

        acks[entry.identity] = AckState::Ready;
        log(LogLevel::Trace, entry.identity + " ready for cycle " + std::to_string(cycleId));
      }
      return std::nullopt;
    }

    SuspendOutcome SuspendCoordinator::commit(const OrderedView& participants,
                                              std::uint64_t cycleId) {
      const auto origin = config_.options.rebootOnSuspendTest ? TokenOrigin::RebootTest
                                                              : TokenOrigin::Suspend;
      auto token = tokens_.newToken(origin);
      if (!token) {
        log(LogLevel::Error, "no entropy for the suspend token");
        return rollback(participants, cycleId, { SuspendStatus::TokenFailure, "", DenyReason::Unspecified, 0 });
      }

      const std::uint64_t epoch = token->epoch;
      if (!tokens_.persist(*token)) {
        log(LogLevel::Error, "suspend token epoch " + std::to_string(epoch) + " not durable");
        return rollback(participants, cycleId, { SuspendStatus::TokenFailure, "", DenyReason::Unspecified, epoch });
      }
      log(LogLevel::Trace, "token epoch " + std::to_string(epoch) + " persisted");

      if (config_.options.swap) {
        bool flushed = false;
        try {
          flushed = platform_.swap->flush();
        } catch (const std::exception& e) {
          log(LogLevel::Error, std::string("swap flush threw: ") + e.what());
        }
        if (!flushed)
          return rollback(participants, cycleId, { SuspendStatus::SwapFailure, "", DenyReason::Unspecified, epoch });
        log(LogLevel::Trace, "swap flushed");
      }

      if (config_.options.rebootOnSuspendTest) {
        log(LogLevel::Info, "reboot-on-suspend: resetting instead of powering down (epoch " +
                                std::to_string(epoch) + ")");
        try {
          platform_.gateway->resetSystem(*token);
        } catch (const std::exception& e) {
          log(LogLevel::Error, std::string("reset threw: ") + e.what());
        }
        // reaching this line means the reset did not happen
        return rollback(participants, cycleId,
                        { SuspendStatus::HardwareTransitionFailure, "", DenyReason::Unspecified, epoch });
      }

      std::optional<io::WakeContext> wake;
      try {
        wake = platform_.gateway->powerDown(*token);
      } catch (const std::exception& e) {
        log(LogLevel::Error, std::string("power-down threw: ") + e.what());
      }
      if (!wake)
        return rollback(participants, cycleId,
                        { SuspendStatus::HardwareTransitionFailure, "", DenyReason::Unspecified, epoch });

      transitionTo(PowerState::Suspended);
      transitionTo(PowerState::Resuming);
      return resume(*wake, participants);
    }

    SuspendOutcome SuspendCoordinator::resume(const io::WakeContext& wake,
                                              const OrderedView& participants) {
      if (!tokens_.validate(wake.token)) {
        std::string msg = "[SuspendCoordinator] wake token mismatch (wake epoch " +
                          std::to_string(wake.token.epoch) + ", last minted " +
                          std::to_string(tokens_.epoch()) + ")";
        errorMonitor_->notifyFailure(msg);
        log(LogLevel::Error, msg);
        return fallbackToColdBoot({ SuspendStatus::TokenMismatch, "", DenyReason::Unspecified, wake.token.epoch });
      }

      const std::uint64_t epoch = wake.token.epoch;
      if (config_.options.swap) {
        bool restored = false;
        try {
          restored = platform_.swap->restore();
        } catch (const std::exception& e) {
          log(LogLevel::Error, std::string("swap restore threw: ") + e.what());
        }
        if (!restored) {
          std::string msg = "[SuspendCoordinator] swap restore failed after wake (epoch " +
                            std::to_string(epoch) + ")";
          errorMonitor_->notifyFailure(msg);
          log(LogLevel::Error, msg);
          return fallbackToColdBoot({ SuspendStatus::RestoreFailure, "", DenyReason::Unspecified, epoch });
        }
        log(LogLevel::Trace, "swap restored");
      }

      // spent: this token must never validate another wake
      if (!tokens_.invalidate())
        log(LogLevel::Error, "could not retire token epoch " + std::to_string(epoch));

      clean_ = true;
      lastResumedEpoch_ = epoch;

      for (const auto& entry : participants.resume()) {
        try {
          notifier_->sendNotification(entry, Notification::resume(entry.tag, epoch));
        } catch (const std::runtime_error& e) {
          dropSubscriber(entry.identity, e.what());
        }
      }

      transitionTo(PowerState::Idle);
      log(LogLevel::Info, "resumed, epoch " + std::to_string(epoch));
      return { SuspendStatus::Resumed, "", DenyReason::Unspecified, epoch };
    }

    SuspendOutcome SuspendCoordinator::rollback(const OrderedView& participants,
                                                std::uint64_t cycleId, SuspendOutcome outcome) {
      broadcastAbort(participants.resume(), cycleId);
      if (!tokens_.invalidate())
        log(LogLevel::Error, "could not invalidate token slot after failed cycle");

      log(LogLevel::Error, std::string("cycle ") + std::to_string(cycleId) + " failed: " +
                               toString(outcome.status));
      transitionTo(PowerState::Idle);
      return outcome;
    }

    SuspendOutcome SuspendCoordinator::fallbackToColdBoot(SuspendOutcome outcome) {
      clean_ = false;
      if (!tokens_.invalidate())
        log(LogLevel::Error, "could not invalidate token slot before re-initialisation");
      transitionTo(PowerState::Idle);

      if (reinitHandler_) {
        try {
          reinitHandler_();
        } catch (const std::exception& e) {
          errorMonitor_->notifyFailure(std::string("[SuspendCoordinator] re-initialisation failed: ") +
                                       e.what());
        }
        return outcome;
      }

      try {
        platform_.gateway->resetSystem(std::nullopt);
      } catch (const std::exception& e) {
        log(LogLevel::Error, std::string("reset threw: ") + e.what());
      }
      errorMonitor_->notifyFailure("[SuspendCoordinator] system reset after untrusted wake did not happen");
      return outcome;
    }

    //---helpers----------------------------------------------------------------

    void SuspendCoordinator::broadcastAbort(const std::vector<SubscriberEntry>& targets,
                                            std::uint64_t cycleId) {
      for (const auto& entry : targets) {
        try {
          notifier_->sendNotification(entry, Notification::abort(entry.tag, cycleId));
        } catch (const std::runtime_error& e) {
          dropSubscriber(entry.identity, e.what());
        }
      }
    }

    void SuspendCoordinator::dropSubscriber(const std::string& identity, const std::string& why) {
      log(LogLevel::Warning, "dropping dead subscriber " + identity + ": " + why);
      registry_.unregisterSubscriber(identity);
      holds_.erase(identity);
      timeoutStreak_.erase(identity);
      notifier_->dropChannel(identity);
    }

    void SuspendCoordinator::noteTimeout(const std::string& identity) {
      auto streak = ++timeoutStreak_[identity];
      log(LogLevel::Warning, identity + " did not acknowledge prepare (" + std::to_string(streak) +
                                 " in a row)");
      if (streak == config_.timeoutEscalationThreshold) {
        errorMonitor_->notifyFailure("[SuspendCoordinator] subscriber " + identity +
                                     " unresponsive for " + std::to_string(streak) + " cycles");
      }
    }

    std::chrono::milliseconds SuspendCoordinator::cycleBudget(std::size_t subscribers) const {
      std::chrono::milliseconds sum =
          config_.ackTimeout * static_cast<std::chrono::milliseconds::rep>(subscribers);
      if (config_.cycleTimeoutCap.count() > 0)
        return std::min(sum, config_.cycleTimeoutCap);
      return sum;
    }

    void SuspendCoordinator::transitionTo(PowerState next) {
      bool legal = false;
      switch (currentState_) {
      case PowerState::Idle:
        legal = next == PowerState::PreparingSuspend;
        break;
      case PowerState::PreparingSuspend:
        legal = next == PowerState::Suspended || next == PowerState::Idle;
        break;
      case PowerState::Suspended:
        legal = next == PowerState::Resuming;
        break;
      case PowerState::Resuming:
        legal = next == PowerState::Idle;
        break;
      }
      if (!legal)
        throw std::logic_error(std::string("[SuspendCoordinator] illegal transition ") +
                               toString(currentState_) + " -> " + toString(next));

      log(LogLevel::Trace, std::string(toString(currentState_)) + " -> " + toString(next));
      currentState_ = next;
    }

    void SuspendCoordinator::requireIdle(const char* operation) const {
      if (currentState_ != PowerState::Idle)
        throw std::logic_error(std::string("[SuspendCoordinator] ") + operation +
                               " rejected while " + toString(currentState_));
    }

    void SuspendCoordinator::log(LogLevel level, const std::string& message) {
      if (level == LogLevel::Trace && !config_.options.debugTrace)
        return;
      logger_->log(level, "SuspendCoordinator", message);
    }

  } // namespace core
} // namespace susres
