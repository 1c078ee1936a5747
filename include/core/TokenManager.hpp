#pragma once
/** @file  TokenManager.hpp
 *  @brief Mints, persists and validates the per-cycle SuspendToken.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <optional>

#include "io/EntropySource.hpp"
#include "io/TokenSlot.hpp"
#include "protocols/SuspendToken.hpp"

namespace susres::core {

  /**
 * @class TokenManager
 * @brief Sole owner of the epoch counter and of the persisted token slot.
 *
 *  * The epoch lives in RAM: it survives suspend and restarts at 0 on cold
 *    boot, so the first token after boot carries epoch 1.
 *  * A token binds nonce *and* epoch, so two cycles never share a token even
 *    if the entropy source repeated itself.
 */
  class TokenManager {
  public:
    TokenManager(std::shared_ptr<io::EntropySource> entropy, std::shared_ptr<io::TokenSlot> slot);

    /// Draws a fresh nonce; std::nullopt (epoch untouched) if entropy is unavailable.
    std::optional<protocols::SuspendToken> newToken(protocols::TokenOrigin origin);

    /// Durable write; must succeed before power-down is requested.
    bool persist(const protocols::SuspendToken& token);

    /// Reads the slot back and compares nonce and epoch with \p observed.
    bool validate(const protocols::SuspendToken& observed);

    /// Overwrites the slot with the never-matching sentinel.
    bool invalidate();

    /// What the slot currently holds (std::nullopt if absent or corrupted).
    std::optional<protocols::SuspendToken> readBack();

    std::uint64_t epoch() const { return epoch_; }

  private:
    std::shared_ptr<io::EntropySource> entropy_;
    std::shared_ptr<io::TokenSlot> slot_;
    std::uint64_t epoch_{ 0 };
  };

} // namespace susres::core
