#pragma once
/** @file  ConfigCache.hpp
 *  @brief On-disk cache of the last fetched provisioning document.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>

#include "config/Config.hpp"

namespace ember {
  namespace config {

    /**
 * @class ConfigCache
 * @brief Reads and writes one serialized Config at a fixed path.
 *
 *  * Written with mode 0640, never world-accessible.
 *  * No temp-file-and-rename: a torn write reads back as CacheCorrupt.
 *  * Single writer per path; callers serialize access if that changes.
 */
    class ConfigCache {
    public:
      explicit ConfigCache(std::filesystem::path path);

      const std::filesystem::path& path() const { return path_; }

      bool exists() const;

      /// Throws ProvisionError: CacheMiss if unreadable, CacheCorrupt if undecodable.
      Config read() const;

      /// Throws ProvisionError: SerializeFailed or CacheWriteFailed.
      void write(const Config& cfg) const;

    private:
      std::filesystem::path path_;
    };

  } // namespace config
} // namespace ember
