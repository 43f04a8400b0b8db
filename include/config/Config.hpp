#pragma once
/** @file  Config.hpp
 *  @brief Provisioning document as handed from providers to stages.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ember {
  namespace config {

    /// The only document version this engine accepts from a provider.
    inline constexpr std::int64_t kSupportedVersion = 1;

    /**
 * @struct Config
 * @brief Top-level sections of the document, each kept as uninterpreted JSON.
 *
 *  * Section contents belong to the stages; nothing here validates them.
 *  * An absent section is `null` and round-trips as `null`.
 */
    struct Config {
      std::int64_t ignitionVersion{ 0 }; ///< full JSON integer width, never narrowed
      nlohmann::json storage;
      nlohmann::json systemd;
      nlohmann::json networkd;
      nlohmann::json passwd;

      bool operator==(const Config& other) const = default;
    };

    void to_json(nlohmann::json& j, const Config& cfg);
    void from_json(const nlohmann::json& j, Config& cfg);

    /**
     * @brief Classify and decode a raw document fetched from a provider.
     *
     * Throws core::ProvisionError with ConfigEmpty, ConfigCloudConfig or
     * ConfigScript for documents that are not ours to apply, ConfigMalformed
     * for broken JSON and UnsupportedVersion for a foreign version.
     */
    Config parse(std::string_view raw);

    /// Compact JSON form used by the on-disk cache.  Throws SerializeFailed.
    std::string serialize(const Config& cfg);

    /// Inverse of serialize().  Throws CacheCorrupt.
    Config deserialize(std::string_view data);

  } // namespace config
} // namespace ember
