/* @file TokenManager.cpp
 * @brief nonce + epoch anti-replay token
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// SusRes headers
#include "core/TokenManager.hpp"

using namespace susres::core;
using susres::protocols::SuspendToken;
using susres::protocols::TokenOrigin;

TokenManager::TokenManager(std::shared_ptr<io::EntropySource> entropy,
                           std::shared_ptr<io::TokenSlot> slot)
    : entropy_(std::move(entropy)), slot_(std::move(slot)) {
  if (!entropy_ || !slot_)
    throw std::invalid_argument("[TokenManager] entropy source and token slot are required");
}

std::optional<SuspendToken> TokenManager::newToken(TokenOrigin origin) {
  if (origin == TokenOrigin::Invalid)
    throw std::invalid_argument("[TokenManager] cannot mint a sentinel token");

  SuspendToken token;
  if (!entropy_->fill(token.nonce.data(), token.nonce.size()))
    return std::nullopt;

  token.epoch = ++epoch_;
  token.origin = origin;
  return token;
}

bool TokenManager::persist(const SuspendToken& token) { return slot_->write(token); }

bool TokenManager::validate(const SuspendToken& observed) {
  auto persisted = slot_->read();
  if (!persisted || !persisted->isValid() || !observed.isValid())
    return false;
  return persisted->sameBinding(observed);
}

bool TokenManager::invalidate() { return slot_->write(SuspendToken::invalid()); }

std::optional<SuspendToken> TokenManager::readBack() { return slot_->read(); }
