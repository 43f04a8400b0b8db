/* @file ConfigCache.cpp
 * @brief POSIX file I/O for the config cache
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <string>
#include <system_error>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// Ember headers
#include "config/ConfigCache.hpp"
#include "core/Errors.hpp"

using ember::core::ErrorKind;
using ember::core::ProvisionError;

namespace {

  constexpr mode_t kCacheMode = S_IRUSR | S_IWUSR | S_IRGRP; // 0640

  std::string describe(const std::filesystem::path& path, const char* op) {
    return std::string(op) + " " + path.string() + ": " + std::strerror(errno);
  }

} // namespace

namespace ember {
  namespace config {

    ConfigCache::ConfigCache(std::filesystem::path path) : path_(std::move(path)) {}

    bool ConfigCache::exists() const {
      std::error_code ec;
      return std::filesystem::exists(path_, ec);
    }

    Config ConfigCache::read() const {
      int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
      if (fd < 0)
        throw ProvisionError(ErrorKind::CacheMiss, describe(path_, "open"));

      std::string data;
      char chunk[4096];
      while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
          data.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
          break; // EOF
        } else if (errno == EINTR) {
          continue;
        } else {
          std::string errMsg = describe(path_, "read");
          ::close(fd);
          throw ProvisionError(ErrorKind::CacheMiss, errMsg);
        }
      }
      ::close(fd);

      return deserialize(data);
    }

    void ConfigCache::write(const Config& cfg) const {
      const std::string out = serialize(cfg);

      int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kCacheMode);
      if (fd < 0)
        throw ProvisionError(ErrorKind::CacheWriteFailed, describe(path_, "open"));

      std::size_t total = 0;
      while (total < out.size()) {
        ssize_t written = ::write(fd, out.data() + total, out.size() - total);
        if (written > 0) {
          total += static_cast<std::size_t>(written);
        } else if (written == -1 && errno == EINTR) {
          continue; // try again
        } else {
          std::string errMsg = describe(path_, "write");
          ::close(fd);
          throw ProvisionError(ErrorKind::CacheWriteFailed, errMsg);
        }
      }

      if (::close(fd) != 0)
        throw ProvisionError(ErrorKind::CacheWriteFailed, describe(path_, "close"));
    }

  } // namespace config
} // namespace ember
