/* @file FileProvider.cpp
 * @brief local file document source
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

// Ember headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "providers/FileProvider.hpp"

using namespace ember::providers;
using ember::core::ErrorKind;
using ember::core::ProvisionError;

FileProvider::FileProvider(core::Logger& log, std::filesystem::path path)
    : log_(log), path_(std::move(path)) {}

std::filesystem::path FileProvider::pathFromEnvironment() {
  const char* env = std::getenv(kEnvVar);
  if (env == nullptr || *env == '\0')
    return kDefaultFilename;
  return env;
}

ember::config::Config FileProvider::fetchConfig() {
  log_.info("using config file at {}", path_.string());

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    log_.err("couldn't read config {}", path_.string());
    throw ProvisionError(ErrorKind::FetchFailed, "couldn't read config " + path_.string());
  }
  std::string raw{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
  if (in.bad()) {
    log_.err("couldn't read config {}", path_.string());
    throw ProvisionError(ErrorKind::FetchFailed, "couldn't read config " + path_.string());
  }

  return config::parse(raw);
}
