/* @file Engine.cpp
 * @brief config acquisition (cache -> wait -> fetch -> cache) and stage dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Ember headers
#include "core/Engine.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ProviderWaiter.hpp"
#include "core/StageRegistry.hpp"
#include "providers/Provider.hpp"
#include "stages/Stage.hpp"

using namespace ember::core;
using ember::config::Config;

Engine::Engine(EngineSettings settings, Logger& log, std::shared_ptr<providers::Provider> provider,
               const StageRegistry& stages)
    : settings_(std::move(settings)),
      log_(log),
      provider_(std::move(provider)),
      stages_(stages),
      cache_(settings_.configCache) {}

bool Engine::run(const std::string& stageName) {
  Config cfg;
  try {
    cfg = acquireConfig();
  } catch (const ProvisionError& e) {
    if (isIgnorable(e.kind())) {
      log_.info("{}: ignoring and exiting...", e.what());
      return true;
    }
    log_.crit("failed to acquire config: {}", e.what());
    return false;
  } catch (const std::exception& e) {
    log_.crit("failed to acquire config: {}", e.what());
    return false;
  }

  ScopedPrefix scope(log_, stageName);

  std::unique_ptr<stages::Stage> stage;
  try {
    stage = stages_.create(stageName, log_, settings_.root);
  } catch (const std::out_of_range& e) {
    log_.crit("{}", e.what());
    return false;
  } catch (const std::exception& e) {
    log_.crit("failed to create stage: {}", e.what());
    return false;
  }
  if (!stage) {
    log_.crit("stage creator returned no stage");
    return false;
  }

  try {
    return stage->run(cfg);
  } catch (const std::exception& e) {
    log_.crit("stage failed: {}", e.what());
    return false;
  }
}

Config Engine::acquireConfig() {
  try {
    Config cfg = cache_.read();
    log_.debug("using cached config from {}", cache_.path().string());
    return cfg;
  } catch (const ProvisionError& e) {
    if (e.kind() != ErrorKind::CacheMiss)
      throw; // corrupt cache is not a miss
    log_.debug("config cache unavailable ({}), fetching from provider", e.what());
  }

  Config cfg = fetchConfig();
  log_.debug("fetched config: {}", config::serialize(cfg));

  cache_.write(cfg);
  return cfg;
}

Config Engine::fetchConfig() {
  if (!provider_)
    throw ProvisionError(ErrorKind::NotOnline, "no config provider configured");

  waitForProvider(*provider_, settings_.onlineTimeout);
  return provider_->fetchConfig();
}
