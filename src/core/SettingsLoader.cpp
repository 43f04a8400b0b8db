/* @file SettingsLoader.cpp
 * @brief JSON settings file -> EngineSettings
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

// nlohmann headers
#include <nlohmann/json.hpp>

// Ember headers
#include "core/SettingsLoader.hpp"

using namespace ember::core;
using json = nlohmann::json;

SettingsLoader::SettingsLoader(std::filesystem::path settingsPath)
    : path_(std::move(settingsPath)) {}

EngineSettings SettingsLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[SettingsLoader] cannot open " + path_.string());

  EngineSettings settings;
  try {
    json doc = json::parse(in);
    if (!doc.is_object())
      throw std::runtime_error("[SettingsLoader] " + path_.string() + ": expected a JSON object");

    if (auto it = doc.find("configCache"); it != doc.end())
      settings.configCache = it->get<std::string>();
    if (auto it = doc.find("onlineTimeoutMs"); it != doc.end())
      settings.onlineTimeout = std::chrono::milliseconds{ it->get<std::int64_t>() };
    if (auto it = doc.find("root"); it != doc.end())
      settings.root = it->get<std::string>();
    if (auto it = doc.find("logToStdout"); it != doc.end())
      settings.logToStdout = it->get<bool>();
  } catch (const json::exception& e) {
    throw std::runtime_error("[SettingsLoader] " + path_.string() + ": " + e.what());
  }
  return settings;
}
