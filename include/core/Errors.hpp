#pragma once
/** @file  Errors.hpp
 *  @brief Closed error taxonomy for config acquisition and dispatch.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ember {
  namespace core {

    /**
 * @enum ErrorKind
 * @brief Every reason an acquisition can end without a usable config.
 *
 *  * `ConfigEmpty`, `ConfigCloudConfig` and `ConfigScript` are ignorable: the
 *    document deliberately carries no work for us.
 *  * `CacheMiss` never leaves the orchestrator; it falls through to a fetch.
 */
    enum class ErrorKind : std::uint8_t {
      NotOnline,
      TimedOut,
      CacheMiss,
      CacheCorrupt,
      SerializeFailed,
      CacheWriteFailed,
      FetchFailed,
      ConfigMalformed,
      UnsupportedVersion,
      ConfigEmpty,
      ConfigCloudConfig,
      ConfigScript,
      Count
    };
    static_assert(static_cast<std::uint8_t>(ErrorKind::Count) == 12,
                  "ErrorKind count changed please update toString() and isIgnorable()");

    const char* toString(ErrorKind kind);

    /// True for the conditions that mean "nothing to do", not "something broke".
    bool isIgnorable(ErrorKind kind);

    /**
 * @class ProvisionError
 * @brief Exception thrown by every acquisition step; callers switch on `kind()`.
 */
    class ProvisionError : public std::runtime_error {
    public:
      ProvisionError(ErrorKind kind, const std::string& message);

      ErrorKind kind() const noexcept { return kind_; }

    private:
      ErrorKind kind_;
    };

  } // namespace core
} // namespace ember
