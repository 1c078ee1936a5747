#pragma once
/** @file  ControlService.hpp
 *  @brief Line-oriented request handler behind the daemon's control socket.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/SuspendCoordinator.hpp"

namespace susres::core {

  /**
 * @class ControlService
 * @brief Turns one request line into one reply line; owns no state of its own.
 *
 *  Requests:
 *  | REGISTER <identity> <address> <tag> [class] | OK <registration id>        |
 *  | UNREGISTER <identity>                       | OK                          |
 *  | HOLD <identity> / RELEASE <identity>        | OK                          |
 *  | SUSPEND                                     | OK <epoch>, BUSY, DENIED ...|
 *  | STATE                                       | OK <state>                  |
 *  | CLEAN                                       | OK <0/1> <last epoch>       |
 *
 *  Malformed input is answered with `ERR <message>`, never an exception.
 */
  class ControlService {
  public:
    explicit ControlService(SuspendCoordinator& coordinator) : coordinator_(coordinator) {}

    std::string handle(const std::string& line);

    /// Reply line for the outcome of one SUSPEND request.
    static std::string formatOutcome(const SuspendOutcome& outcome);

  private:
    SuspendCoordinator& coordinator_;
  };

} // namespace susres::core
