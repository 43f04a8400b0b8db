#pragma once
/** @file  Provider.hpp
 *  @brief Abstract source of provisioning documents.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include "config/Config.hpp"

namespace ember::providers {

  /**
 * @class Provider
 * @brief Common polymorphic interface for every metadata source
 *        (local file, kernel command line, cloud metadata service...).
 *
 *  * `isOnline()` and `shouldRetry()` are cheap, non-blocking queries; the
 *    readiness waiter calls them from its polling thread.
 *  * `fetchConfig()` may block and is called at most once per acquisition.
 */
  class Provider {
  public:
    virtual ~Provider() = default;

    virtual std::string name() const = 0;

    /// True once the document can be fetched.
    virtual bool isOnline() = 0;

    /// False once polling again cannot change the answer of isOnline().
    virtual bool shouldRetry() = 0;

    /// How long to wait before the next isOnline() poll.
    virtual std::chrono::milliseconds backoffDuration() = 0;

    /**
     * @brief Retrieve and decode the document.
     *
     * Throws core::ProvisionError: FetchFailed when retrieval fails, or the
     * classification produced by config::parse().
     */
    virtual config::Config fetchConfig() = 0;
  };

} // namespace ember::providers
