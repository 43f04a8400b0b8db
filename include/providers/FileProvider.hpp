#pragma once
/** @file  FileProvider.hpp
 *  @brief Provider that reads the document from a local file.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>

#include "providers/Provider.hpp"

namespace ember {
  namespace core {
    class Logger;
  } // namespace core

  namespace providers {

    /**
 * @class FileProvider
 * @brief Always online, never retried; the file either holds a document or not.
 */
    class FileProvider : public Provider {
    public:
      static constexpr const char* kEnvVar = "EMBER_CONFIG_FILE";
      static constexpr const char* kDefaultFilename = "config.ign";

      FileProvider(core::Logger& log, std::filesystem::path path);

      /// $EMBER_CONFIG_FILE when set and non-empty, otherwise `config.ign`.
      static std::filesystem::path pathFromEnvironment();

      std::string name() const override { return "file"; }
      bool isOnline() override { return true; }
      bool shouldRetry() override { return false; }
      std::chrono::milliseconds backoffDuration() override { return std::chrono::milliseconds{ 0 }; }
      config::Config fetchConfig() override;

    private:
      core::Logger& log_;
      std::filesystem::path path_;
    };

  } // namespace providers
} // namespace ember
