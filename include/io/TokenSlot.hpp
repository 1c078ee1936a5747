#pragma once
/** @file  TokenSlot.hpp
 *  @brief The one record that survives the power transition.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <utility>

#include "protocols/SuspendToken.hpp"

namespace susres {
  namespace io {

    /**
 * @class TokenSlot
 * @brief Write-once-per-cycle, read-once-per-wake storage for SuspendToken.
 *
 *  * `write()` returning true means the record is durable.
 *  * `read()` returns std::nullopt for a missing or corrupted record.
 */
    class TokenSlot {
    public:
      virtual ~TokenSlot() = default;

      virtual bool write(const protocols::SuspendToken& token) = 0;
      virtual std::optional<protocols::SuspendToken> read() = 0;
    };

    /// Fixed 32-byte file, fsync'ed before write() returns.
    class FileTokenSlot : public TokenSlot {
    public:
      explicit FileTokenSlot(std::string path) : path_(std::move(path)) {}

      bool write(const protocols::SuspendToken& token) override;
      std::optional<protocols::SuspendToken> read() override;

      const std::string& path() const { return path_; }

    private:
      std::string path_;
    };

  } // namespace io
} // namespace susres
