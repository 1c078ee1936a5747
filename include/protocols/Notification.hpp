#pragma once
/** @file  Notification.hpp
 *  @brief Phase notification sent from the orchestrator to one subscriber.
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

    enum class Phase : std::uint8_t { Prepare, Abort, Resume };

    inline const char* toString(Phase p) {
      switch (p) {
      case Phase::Prepare:
        return "PREPARE";
      case Phase::Abort:
        return "ABORT";
      case Phase::Resume:
        return "RESUME";
      default:
        return "UNKNOWN";
      }
    }

    /**
     * @struct Notification
     * @brief `<tag> <PHASE> <arg>` on the wire.
     *
     *  * `arg` is the cycle id for Prepare/Abort and the validated epoch for Resume.
     *  * `tag` is the opcode the subscriber registered, echoed back so it can
     *    route the message inside its own dispatch loop.
     */
    struct Notification {
      std::uint32_t tag{ 0 };
      Phase phase{ Phase::Prepare };
      std::uint64_t arg{ 0 };

      static Notification prepare(std::uint32_t tag, std::uint64_t cycleId) {
        return { tag, Phase::Prepare, cycleId };
      }
      static Notification abort(std::uint32_t tag, std::uint64_t cycleId) {
        return { tag, Phase::Abort, cycleId };
      }
      static Notification resume(std::uint32_t tag, std::uint64_t epoch) {
        return { tag, Phase::Resume, epoch };
      }

      std::string toWire() const {
        return std::to_string(tag) + " " + toString(phase) + " " + std::to_string(arg) + "\r\n";
      }

      /// Subscriber-side decoder; std::nullopt on any malformed field.
      static std::optional<Notification> fromWire(const std::string& line) {
        auto fields = splitFields(line);
        if (fields.size() != 3)
          return std::nullopt;

        auto tag = parseUnsigned(fields[0]);
        auto arg = parseUnsigned(fields[2]);
        if (!tag || !arg || *tag > UINT32_MAX)
          return std::nullopt;

        Notification n;
        n.tag = static_cast<std::uint32_t>(*tag);
        n.arg = *arg;
        if (fields[1] == "PREPARE")
          n.phase = Phase::Prepare;
        else if (fields[1] == "ABORT")
          n.phase = Phase::Abort;
        else if (fields[1] == "RESUME")
          n.phase = Phase::Resume;
        else
          return std::nullopt;
        return n;
      }

      bool operator==(const Notification&) const = default;
    };

  } // namespace protocols
} // namespace susres
