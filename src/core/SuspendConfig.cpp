/* @file SuspendConfig.cpp
 * @brief schema validation for the JSON configuration
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// SusRes headers
#include "core/SuspendConfig.hpp"

using namespace susres::core;

namespace {

  [[noreturn]] void badKey(const std::string& key, const char* expected) {
    throw std::runtime_error("[SuspendConfig] '" + key + "' must be " + expected);
  }

  void readString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
      return;
    if (!it->is_string() || it->get<std::string>().empty())
      badKey(key, "a non-empty string");
    out = it->get<std::string>();
  }

  void readBool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
      return;
    if (!it->is_boolean())
      badKey(key, "a boolean");
    out = it->get<bool>();
  }

  void readMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out,
                  bool allowZero) {
    auto it = j.find(key);
    if (it == j.end())
      return;
    // integral only; signed and unsigned storage both count
    if (!it->is_number_integer() || it->get<std::int64_t>() < (allowZero ? 0 : 1))
      badKey(key, allowZero ? "a non-negative integer" : "a positive integer");
    out = std::chrono::milliseconds{ it->get<std::int64_t>() };
  }

} // namespace

SuspendConfig SuspendConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object())
    throw std::runtime_error("[SuspendConfig] top level must be an object");

  SuspendConfig cfg;
  readMillis(j, "ackTimeoutMs", cfg.ackTimeout, false);
  readMillis(j, "cycleTimeoutCapMs", cfg.cycleTimeoutCap, true);

  if (auto it = j.find("timeoutEscalationThreshold"); it != j.end()) {
    if (!it->is_number_integer() || it->get<std::int64_t>() < 1 ||
        it->get<std::int64_t>() > UINT32_MAX)
      badKey("timeoutEscalationThreshold", "a positive integer");
    cfg.timeoutEscalationThreshold = it->get<std::uint32_t>();
  }

  readString(j, "tokenSlotPath", cfg.tokenSlotPath);
  readString(j, "bootHandoffPath", cfg.bootHandoffPath);
  readString(j, "powerStatePath", cfg.powerStatePath);
  readString(j, "entropyDevice", cfg.entropyDevice);
  readString(j, "swapAddress", cfg.swapAddress);
  readString(j, "controlSocket", cfg.controlSocket);
  readString(j, "logPath", cfg.logPath);

  if (auto it = j.find("options"); it != j.end()) {
    if (!it->is_object())
      badKey("options", "an object");
    readBool(*it, "swap", cfg.options.swap);
    readBool(*it, "rebootOnSuspendTest", cfg.options.rebootOnSuspendTest);
    readBool(*it, "debugTrace", cfg.options.debugTrace);
  }

  return cfg;
}
