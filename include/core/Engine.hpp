#pragma once

/** @file  Engine.hpp
 *  @brief Public API for ember::core::Engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

#include "config/Config.hpp"
#include "config/ConfigCache.hpp"
#include "core/EngineSettings.hpp"

namespace ember {
  namespace providers {
    class Provider;
  } // namespace providers

  namespace core {

    class Logger;
    class StageRegistry;

    /**
 * @class Engine
 * @brief Obtains the provisioning document and runs one stage with it.
 *
 *  * Cache first; the provider is only consulted on a cache miss.
 *  * Every failure is resolved here into the boolean result of `run()`.
 */
    class Engine {

    public:
      Engine(EngineSettings settings, Logger& log, std::shared_ptr<providers::Provider> provider,
             const StageRegistry& stages);
      ~Engine() = default;

      /// Runs stage @p stageName.  True on success or when there is deliberately nothing to do.
      bool run(const std::string& stageName);

      /**
       * @brief Cached document, or a freshly fetched one that is then cached.
       *
       * Throws ProvisionError.  A corrupt cache is fatal and is not refetched;
       * a failed cache write is reported even though a document was fetched.
       */
      config::Config acquireConfig();

    private:
      config::Config fetchConfig();

      EngineSettings settings_;
      Logger& log_;
      std::shared_ptr<providers::Provider> provider_;
      const StageRegistry& stages_;
      config::ConfigCache cache_;
    };

  } // namespace core
} // namespace ember
