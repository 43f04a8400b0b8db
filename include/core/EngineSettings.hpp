#pragma once
/** @file  EngineSettings.hpp
 *  @brief Run-time inputs of the engine with their defaults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <filesystem>

namespace ember::core {

  inline constexpr std::chrono::milliseconds kDefaultOnlineTimeout = std::chrono::minutes{ 1 };

  struct EngineSettings {
    std::filesystem::path configCache{ "/tmp/ember.json" }; ///< cached document
    std::chrono::milliseconds onlineTimeout{ kDefaultOnlineTimeout }; ///< <= 0 waits forever
    std::filesystem::path root{ "/" }; ///< filesystem root handed to stages
    bool logToStdout{ false };         ///< syslog otherwise
  };

} // namespace ember::core
