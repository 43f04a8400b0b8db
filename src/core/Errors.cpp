/* @file Errors.cpp
 * @brief names and classification for ErrorKind
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Errors.hpp"

namespace ember {
  namespace core {

    const char* toString(ErrorKind kind) {
      switch (kind) {
      case ErrorKind::NotOnline:
        return "NotOnline";
      case ErrorKind::TimedOut:
        return "TimedOut";
      case ErrorKind::CacheMiss:
        return "CacheMiss";
      case ErrorKind::CacheCorrupt:
        return "CacheCorrupt";
      case ErrorKind::SerializeFailed:
        return "SerializeFailed";
      case ErrorKind::CacheWriteFailed:
        return "CacheWriteFailed";
      case ErrorKind::FetchFailed:
        return "FetchFailed";
      case ErrorKind::ConfigMalformed:
        return "ConfigMalformed";
      case ErrorKind::UnsupportedVersion:
        return "UnsupportedVersion";
      case ErrorKind::ConfigEmpty:
        return "ConfigEmpty";
      case ErrorKind::ConfigCloudConfig:
        return "ConfigCloudConfig";
      case ErrorKind::ConfigScript:
        return "ConfigScript";
      default:
        return "Unknown";
      }
    }

    bool isIgnorable(ErrorKind kind) {
      switch (kind) {
      case ErrorKind::ConfigEmpty:
      case ErrorKind::ConfigCloudConfig:
      case ErrorKind::ConfigScript:
        return true;
      default:
        return false;
      }
    }

    ProvisionError::ProvisionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

  } // namespace core
} // namespace ember
