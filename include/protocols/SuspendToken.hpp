#pragma once
/** @file  SuspendToken.hpp
 *  @brief Per-cycle anti-replay token and its fixed-width persisted record.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace susres {
  namespace protocols {

    enum class TokenOrigin : std::uint8_t {
      Invalid = 0,    ///< cold-boot sentinel, never matches
      Suspend = 1,    ///< genuine hardware suspend
      RebootTest = 2, ///< suspend replaced by a full reset
    };

    /**
     * @struct SuspendToken
     * @brief {nonce, epoch, origin}; valid for exactly one suspend/resume cycle.
     *
     *  Record layout (32 bytes, little-endian):
     *  | 0..3 "SRTK" | 4 origin | 5..7 zero | 8..15 epoch | 16..31 nonce |
     */
    struct SuspendToken {
      static constexpr std::size_t kNonceBytes = 16;
      static constexpr std::size_t kRecordBytes = 32;

      using Nonce = std::array<std::uint8_t, kNonceBytes>;
      using Record = std::array<std::uint8_t, kRecordBytes>;

      Nonce nonce{};
      std::uint64_t epoch{ 0 };
      TokenOrigin origin{ TokenOrigin::Invalid };

      static SuspendToken invalid() { return SuspendToken{}; }

      bool isValid() const { return origin != TokenOrigin::Invalid && epoch != 0; }

      /// Nonce and epoch only; origin is not part of the binding.
      bool sameBinding(const SuspendToken& other) const {
        return nonce == other.nonce && epoch == other.epoch;
      }

      bool operator==(const SuspendToken&) const = default;

      Record toRecord() const {
        Record r{};
        r[0] = 'S';
        r[1] = 'R';
        r[2] = 'T';
        r[3] = 'K';
        r[4] = static_cast<std::uint8_t>(origin);
        for (std::size_t i = 0; i < 8; ++i)
          r[8 + i] = static_cast<std::uint8_t>(epoch >> (8 * i));
        for (std::size_t i = 0; i < kNonceBytes; ++i)
          r[16 + i] = nonce[i];
        return r;
      }

      /// std::nullopt on bad magic, non-zero padding or an unknown origin.
      static std::optional<SuspendToken> fromRecord(const Record& r) {
        if (r[0] != 'S' || r[1] != 'R' || r[2] != 'T' || r[3] != 'K')
          return std::nullopt;
        if (r[5] != 0 || r[6] != 0 || r[7] != 0)
          return std::nullopt;
        if (r[4] > static_cast<std::uint8_t>(TokenOrigin::RebootTest))
          return std::nullopt;

        SuspendToken t;
        t.origin = static_cast<TokenOrigin>(r[4]);
        for (std::size_t i = 0; i < 8; ++i)
          t.epoch |= static_cast<std::uint64_t>(r[8 + i]) << (8 * i);
        for (std::size_t i = 0; i < kNonceBytes; ++i)
          t.nonce[i] = r[16 + i];
        return t;
      }
    };

  } // namespace protocols
} // namespace susres
