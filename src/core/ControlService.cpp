/* @file ControlService.cpp
 * @brief parses control requests and maps coordinator results to reply lines
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <vector>

// SusRes headers
#include "core/ControlService.hpp"
#include "protocols/WireFormat.hpp"

using namespace susres::core;
using susres::protocols::parseUnsigned;
using susres::protocols::splitFields;

std::string ControlService::formatOutcome(const SuspendOutcome& outcome) {
  switch (outcome.status) {
  case SuspendStatus::Resumed:
    return "OK " + std::to_string(outcome.epoch);
  case SuspendStatus::Busy:
    return "BUSY";
  case SuspendStatus::Denied:
    return "DENIED " + outcome.identity + " " + protocols::toString(outcome.reason);
  case SuspendStatus::Timeout:
    return "TIMEOUT " + outcome.identity;
  case SuspendStatus::HardwareTransitionFailure:
    return "HWFAIL";
  case SuspendStatus::SwapFailure:
    return "SWAPFAIL";
  default:
    // woke but fell back to re-initialisation, or never got a durable token
    return std::string("ERR ") + toString(outcome.status);
  }
}

std::string ControlService::handle(const std::string& line) {
  const std::vector<std::string> f = splitFields(line);
  if (f.empty())
    return "ERR empty request";

  const std::string& verb = f[0];
  try {
    if (verb == "REGISTER") {
      if (f.size() != 4 && f.size() != 5)
        return "ERR usage: REGISTER <identity> <address> <tag> [class]";
      auto tag = parseUnsigned(f[3]);
      if (!tag || *tag > UINT32_MAX)
        return "ERR bad tag '" + f[3] + "'";
      SuspendOrder order = SuspendOrder::Normal;
      if (f.size() == 5) {
        auto parsed = suspendOrderFromString(f[4]);
        if (!parsed)
          return "ERR unknown order class '" + f[4] + "'";
        order = *parsed;
      }
      auto id = coordinator_.registerSubscriber(f[1], f[2], static_cast<std::uint32_t>(*tag), order);
      return "OK " + std::to_string(id);
    }

    if (verb == "UNREGISTER" && f.size() == 2) {
      coordinator_.unregisterSubscriber(f[1]);
      return "OK";
    }
    if (verb == "HOLD" && f.size() == 2) {
      coordinator_.hold(f[1]);
      return "OK";
    }
    if (verb == "RELEASE" && f.size() == 2) {
      coordinator_.release(f[1]);
      return "OK";
    }
    if (verb == "SUSPEND" && f.size() == 1)
      return formatOutcome(coordinator_.requestSuspend());
    if (verb == "STATE" && f.size() == 1)
      return std::string("OK ") + toString(coordinator_.state());
    if (verb == "CLEAN" && f.size() == 1)
      return std::string("OK ") + (coordinator_.wasSuspendClean() ? "1 " : "0 ") +
             std::to_string(coordinator_.lastResumedEpoch());
  } catch (const std::logic_error& e) {
    // registry mutation attempted mid-cycle, or a hold for an unknown identity
    if (coordinator_.state() != PowerState::Idle)
      return "BUSY";
    return std::string("ERR ") + e.what();
  }

  return "ERR unknown request '" + verb + "'";
}
