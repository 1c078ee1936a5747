#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from flash or host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace susres::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to
 *        the caller.
 *
 *  * No caching: `load()` re-reads the file; susresd calls it once at start-up.
 *  * All schema validation lives in the calling layer (SuspendConfig::fromJson).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on flash/host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

  private:
    std::string path_;
  };

} // namespace susres::core
