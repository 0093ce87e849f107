#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace hearo::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching, every call to `load()` re-reads the file (tiny file).
 *  * A missing file is not an error: `load()` returns an empty object and
 *    every section falls back to its built-in defaults.
 *  * Schema mapping lives in Config.hpp (`parseConfig`).
 */
  class ConfigLoader {
  public:
    static constexpr const char* kDefaultPath = "/etc/hearo/hearo.json";

    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath = kDefaultPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    bool exists() const;
    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace hearo::core
