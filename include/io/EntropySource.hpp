#pragma once
/** @file  EntropySource.hpp
 *  @brief "Give me N unpredictable bytes" capability backed by the TRNG.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace susres {
  namespace io {

    class EntropySource {
    public:
      virtual ~EntropySource() = default;

      /** Fills \p len bytes at \p out; false if the source could not deliver them all. */
      virtual bool fill(std::uint8_t* out, std::size_t len) = 0;
    };

    /**
 * @class DevRandomSource
 * @brief Reads a random character device, `/dev/hwrng` on the handheld and
 *        `/dev/urandom` on a development host.
 *
 *  * Opens the device per call; token generation happens once per cycle.
 */
    class DevRandomSource : public EntropySource {
    public:
      explicit DevRandomSource(std::string device = "/dev/urandom") : device_(std::move(device)) {}

      bool fill(std::uint8_t* out, std::size_t len) override;

    private:
      std::string device_;
    };

  } // namespace io
} // namespace susres
