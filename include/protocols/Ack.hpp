#pragma once
/** @file  Ack.hpp
 *  @brief Prepare-phase acknowledgement returned by a subscriber.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// SusRes headers
#include "protocols/WireFormat.hpp"

namespace susres {
  namespace protocols {

    /// Numeric reason carried by `DENY`. Unknown codes are passed through unchanged.
    enum class DenyReason : std::uint32_t {
      Unspecified = 0,
      Busy = 1,
      CriticalOperation = 2,
      Timeout = 3,
      Vetoed = 4,
      DeadPeer = 5,
      ProtocolError = 6,
    };

    inline const char* toString(DenyReason r) {
      switch (r) {
      case DenyReason::Unspecified:
        return "unspecified";
      case DenyReason::Busy:
        return "busy";
      case DenyReason::CriticalOperation:
        return "critical-operation";
      case DenyReason::Timeout:
        return "timeout";
      case DenyReason::Vetoed:
        return "vetoed";
      case DenyReason::DeadPeer:
        return "dead-peer";
      case DenyReason::ProtocolError:
        return "protocol-error";
      default:
        return "unknown";
      }
    }

    /**
     * @struct Ack
     * @brief `READY <cycle>` or `DENY <cycle> <reason>`.
     */
    struct Ack {
      enum class Kind : std::uint8_t { Ready, Deny };

      Kind kind{ Kind::Ready };
      std::uint64_t cycleId{ 0 };
      DenyReason reason{ DenyReason::Unspecified };

      static Ack ready(std::uint64_t cycleId) { return { Kind::Ready, cycleId, DenyReason::Unspecified }; }
      static Ack deny(std::uint64_t cycleId, DenyReason reason) { return { Kind::Deny, cycleId, reason }; }

      bool isReady() const { return kind == Kind::Ready; }

      std::string toWire() const {
        if (kind == Kind::Ready)
          return "READY " + std::to_string(cycleId) + "\r\n";
        return "DENY " + std::to_string(cycleId) + " " +
               std::to_string(static_cast<std::uint32_t>(reason)) + "\r\n";
      }

      static std::optional<Ack> fromWire(const std::string& line) {
        auto fields = splitFields(line);
        if (fields.empty())
          return std::nullopt;

        if (fields[0] == "READY" && fields.size() == 2) {
          if (auto cycle = parseUnsigned(fields[1]))
            return ready(*cycle);
          return std::nullopt;
        }

        if (fields[0] == "DENY" && fields.size() == 3) {
          auto cycle = parseUnsigned(fields[1]);
          auto code = parseUnsigned(fields[2]);
          if (!cycle || !code || *code > UINT32_MAX)
            return std::nullopt;
          return deny(*cycle, static_cast<DenyReason>(*code));
        }

        return std::nullopt;
      }

      bool operator==(const Ack&) const = default;
    };

  } // namespace protocols
} // namespace susres
