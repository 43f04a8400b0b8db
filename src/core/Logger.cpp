/* @file Logger.cpp
 * @brief spdlog sinks and prefix rendering
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Linux headers
#include <syslog.h>

// spdlog headers
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

// Ember headers
#include "core/EngineSettings.hpp"
#include "core/Logger.hpp"

using namespace ember::core;

namespace {

  std::shared_ptr<spdlog::logger> prepare(std::shared_ptr<spdlog::logger> backend) {
    backend->set_level(spdlog::level::debug);
    backend->flush_on(spdlog::level::err);
    return backend;
  }

} // namespace

Logger::Logger(std::shared_ptr<spdlog::logger> backend) : backend_(std::move(backend)) {
  if (!backend_)
    throw std::invalid_argument("[Logger] backend is nullptr");
}

Logger Logger::toStdout() {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  return Logger(prepare(std::make_shared<spdlog::logger>("ember", std::move(sink))));
}

Logger Logger::toSyslog(const std::string& ident) {
  auto sink = std::make_shared<spdlog::sinks::syslog_sink_mt>(ident, LOG_PID, LOG_DAEMON,
                                                              /*enable_formatting=*/false);
  return Logger(prepare(std::make_shared<spdlog::logger>(ident, std::move(sink))));
}

Logger Logger::fromSettings(const EngineSettings& settings) {
  return settings.logToStdout ? toStdout() : toSyslog();
}

void Logger::pushPrefix(std::string prefix) { prefixes_.push_back(std::move(prefix)); }

void Logger::popPrefix() {
  if (!prefixes_.empty())
    prefixes_.pop_back();
}

void Logger::emit(spdlog::level::level_enum lvl, const std::string& message) {
  std::string line;
  for (const auto& p : prefixes_) {
    line += p;
    line += ": ";
  }
  line += message;
  backend_->log(lvl, "{}", line);
}
