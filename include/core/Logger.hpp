#pragma once
/** @file  Logger.hpp
 *  @brief Prefix-scoped logger on top of an spdlog backend.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ember {
  namespace core {

    struct EngineSettings;

    /**
 * @class Logger
 * @brief Severity-tagged log lines, each prefixed by the active scope stack.
 *
 *  * A line reads `disks: partition: created sda1` after pushing "disks" and
 *    "partition".
 *  * Not thread-safe: one Logger belongs to one engine run.
 */
    class Logger {
    public:
      explicit Logger(std::shared_ptr<spdlog::logger> backend);
      ~Logger() = default;

      static Logger toStdout();
      static Logger toSyslog(const std::string& ident = "ember");
      /// Stdout when `settings.logToStdout` is set, syslog otherwise.
      static Logger fromSettings(const EngineSettings& settings);

      const std::shared_ptr<spdlog::logger>& backend() const { return backend_; }

      // --- prefix scope ---
      void pushPrefix(std::string prefix);
      void popPrefix(); ///< no-op when nothing is pushed
      std::size_t depth() const { return prefixes_.size(); }

      // --- severities ---
      template <typename... Args>
      void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        emit(spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
      }

      template <typename... Args>
      void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        emit(spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
      }

      template <typename... Args>
      void notice(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        emit(spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
      }

      template <typename... Args>
      void warning(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        emit(spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
      }

      template <typename... Args>
      void err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        emit(spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
      }

      template <typename... Args>
      void crit(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        emit(spdlog::level::critical, fmt::format(fmt, std::forward<Args>(args)...));
      }

    private:
      void emit(spdlog::level::level_enum lvl, const std::string& message);

      std::shared_ptr<spdlog::logger> backend_;
      std::vector<std::string> prefixes_;
    };

    /// Pushes a prefix for the lifetime of the object.
    class ScopedPrefix {
    public:
      ScopedPrefix(Logger& log, std::string prefix) : log_(log) {
        log_.pushPrefix(std::move(prefix));
      }
      ~ScopedPrefix() { log_.popPrefix(); }

      ScopedPrefix(const ScopedPrefix&) = delete;
      ScopedPrefix& operator=(const ScopedPrefix&) = delete;

    private:
      Logger& log_;
    };

  } // namespace core
} // namespace ember
