#pragma once
/** @file  PowerGateway.hpp
 *  @brief The only component that cuts and restores clocks and power rails.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <utility>

#include "io/TokenSlot.hpp"
#include "protocols/SuspendToken.hpp"

namespace susres {
  namespace io {

    /// What the wake path hands back: the token carried across the transition.
    struct WakeContext {
      protocols::SuspendToken token;
    };

    /**
 * @class PowerGateway
 * @brief Hardware-facing seam of the orchestrator.
 *
 *  * `powerDown()` blocks until the wake event; std::nullopt means the
 *    hardware refused or failed the transition and nothing was powered off.
 *  * `resetSystem()` does not return on real hardware. \p handoff is the
 *    token the next boot should see as its boot context.
 *  * `takeBootContext()` is read once at startup and consumed.
 */
    class PowerGateway {
    public:
      virtual ~PowerGateway() = default;

      virtual std::optional<WakeContext> powerDown(const protocols::SuspendToken& token) = 0;
      virtual void resetSystem(const std::optional<protocols::SuspendToken>& handoff) = 0;
      virtual std::optional<protocols::SuspendToken> takeBootContext() = 0;
    };

    /**
 * @class SysfsPowerGateway
 * @brief Linux back-end: `mem` into /sys/power/state, reboot(2) for reset.
 *
 *  * RAM is retained across suspend-to-RAM, so the wake context is the token
 *    this object was holding when the kernel returned from the write.
 *  * The reset hand-off goes through a second record file (the bootloader
 *    scratch page on the handheld).
 */
    class SysfsPowerGateway : public PowerGateway {
    public:
      SysfsPowerGateway(std::string statePath, std::string handoffPath)
          : statePath_(std::move(statePath)), handoff_(std::move(handoffPath)) {}

      std::optional<WakeContext> powerDown(const protocols::SuspendToken& token) override;
      void resetSystem(const std::optional<protocols::SuspendToken>& handoff) override;
      std::optional<protocols::SuspendToken> takeBootContext() override;

    private:
      std::string statePath_;
      FileTokenSlot handoff_;
    };

  } // namespace io
} // namespace susres
