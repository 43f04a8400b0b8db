#pragma once
/** @file  SettingsLoader.hpp
 *  @brief Loads engine settings (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>

#include "core/EngineSettings.hpp"

namespace ember::core {

  /**
 * @class SettingsLoader
 * @brief Thin helper that reads a JSON file and overlays it on the defaults.
 *
 *  * Recognised keys: `configCache`, `onlineTimeoutMs`, `root`, `logToStdout`.
 *  * Missing keys keep their EngineSettings defaults; unknown keys are ignored.
 *  * Every call to `load()` re-reads the file.
 */
  class SettingsLoader {
  public:
    /// @param settingsPath  Absolute or relative path on the host FS.
    explicit SettingsLoader(std::filesystem::path settingsPath);

    /// Parse the file into EngineSettings or throw `std::runtime_error`.
    EngineSettings load() const;

  private:
    std::filesystem::path path_;
  };

} // namespace ember::core
