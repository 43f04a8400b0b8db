#pragma once
/** @file  ProviderWaiter.hpp
 *  @brief Bounded wait for a provider to come online.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>

namespace ember::providers {
  class Provider;
}

namespace ember::core {

  /**
   * @brief Poll @p provider until it is online, it gives up, or @p timeout elapses.
   *
   *  * Polling runs on a private thread that sleeps `backoffDuration()` between
   *    polls; the sleep is cut short as soon as this call has its answer.
   *  * The polling thread is joined before returning, so no provider method
   *    runs after this call returns, on any path.
   *  * `timeout <= 0`, or one too long for the steady clock, waits forever.
   *  * A poll already in flight when the deadline passes is allowed to finish;
   *    if it reports online, the wait succeeds.
   *  * Advised backoffs are capped at five minutes.
   *
   * Throws ProvisionError with NotOnline when the provider declines to retry,
   * TimedOut when the deadline passes first.
   */
  void waitForProvider(providers::Provider& provider, std::chrono::milliseconds timeout);

} // namespace ember::core
