/* @file Config.cpp
 * @brief document classification and (de)serialization
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// Ember headers
#include "config/Config.hpp"
#include "core/Errors.hpp"

using ember::core::ErrorKind;
using ember::core::ProvisionError;
using json = nlohmann::json;

namespace {

  constexpr std::string_view kWhitespace = " \t\r\n";
  constexpr std::string_view kCloudConfigHeader = "#cloud-config";
  constexpr std::string_view kScriptHeader = "#!";

  bool isBlank(std::string_view raw) {
    return raw.find_first_not_of(kWhitespace) == std::string_view::npos;
  }

  bool isCloudConfig(std::string_view raw) {
    auto firstLine = raw.substr(0, raw.find('\n'));
    auto end = firstLine.find_last_not_of(kWhitespace);
    if (end == std::string_view::npos)
      return false;
    return firstLine.substr(0, end + 1) == kCloudConfigHeader;
  }

  json sectionOf(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? json() : *it;
  }

} // namespace

namespace ember {
  namespace config {

    void to_json(json& j, const Config& cfg) {
      j = json{ { "ignitionVersion", cfg.ignitionVersion },
                { "storage", cfg.storage },
                { "systemd", cfg.systemd },
                { "networkd", cfg.networkd },
                { "passwd", cfg.passwd } };
    }

    void from_json(const json& j, Config& cfg) {
      j.at("ignitionVersion").get_to(cfg.ignitionVersion);
      cfg.storage = sectionOf(j, "storage");
      cfg.systemd = sectionOf(j, "systemd");
      cfg.networkd = sectionOf(j, "networkd");
      cfg.passwd = sectionOf(j, "passwd");
    }

    Config parse(std::string_view raw) {
      if (isBlank(raw))
        throw ProvisionError(ErrorKind::ConfigEmpty, "not a config (empty)");
      if (isCloudConfig(raw))
        throw ProvisionError(ErrorKind::ConfigCloudConfig, "not a config (found cloud-config)");
      if (raw.starts_with(kScriptHeader))
        throw ProvisionError(ErrorKind::ConfigScript, "not a config (found script)");

      json doc = json::parse(raw.begin(), raw.end(), nullptr, /*allow_exceptions=*/false);
      if (doc.is_discarded() || !doc.is_object())
        throw ProvisionError(ErrorKind::ConfigMalformed, "config is not a JSON object");

      auto version = doc.find("ignitionVersion");
      if (version == doc.end() || !version->is_number_integer() ||
          version->get<std::int64_t>() != kSupportedVersion) {
        throw ProvisionError(ErrorKind::UnsupportedVersion,
                             "unsupported config version (expected " +
                                 std::to_string(kSupportedVersion) + ")");
      }

      try {
        return doc.get<Config>();
      } catch (const json::exception& e) {
        throw ProvisionError(ErrorKind::ConfigMalformed, std::string("invalid config: ") + e.what());
      }
    }

    std::string serialize(const Config& cfg) {
      try {
        return json(cfg).dump();
      } catch (const json::exception& e) {
        throw ProvisionError(ErrorKind::SerializeFailed,
                             std::string("failed to serialize config: ") + e.what());
      }
    }

    Config deserialize(std::string_view data) {
      try {
        return json::parse(data.begin(), data.end()).get<Config>();
      } catch (const json::exception& e) {
        throw ProvisionError(ErrorKind::CacheCorrupt,
                             std::string("failed to parse cached config: ") + e.what());
      }
    }

  } // namespace config
} // namespace ember
