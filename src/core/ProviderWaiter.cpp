/* @file ProviderWaiter.cpp
 * @brief polling thread raced against a deadline on one condition variable
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

// Ember headers
#include "core/Errors.hpp"
#include "core/ProviderWaiter.hpp"
#include "providers/Provider.hpp"

using ember::providers::Provider;
using Clock = std::chrono::steady_clock;

namespace {

  /// Longest sleep between polls, whatever the provider advises.
  constexpr std::chrono::milliseconds kMaxBackoff = std::chrono::minutes{ 5 };

  enum class Signal { None, Online, NotOnline };

  /// State shared by the polling thread and the arbiter; outlives the thread.
  struct Rendezvous {
    std::mutex mtx;
    std::condition_variable_any cv;
    Signal signal{ Signal::None };
    bool polling{ false }; ///< a query round is in flight
    bool decided{ false }; ///< the arbiter has its answer; no new rounds
  };

  /// Deadline for a positive timeout the clock can represent; nullopt waits forever.
  std::optional<Clock::time_point> deadlineAfter(std::chrono::milliseconds timeout) {
    if (timeout <= std::chrono::milliseconds::zero())
      return std::nullopt;

    const auto now = Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom)
      return std::nullopt;
    return now + timeout;
  }

  void pollProvider(std::stop_token stop, Provider& provider, Rendezvous& rv) {
    for (;;) {
      {
        std::lock_guard<std::mutex> lk(rv.mtx);
        if (rv.decided)
          return;
        rv.polling = true;
      }

      Signal answer = Signal::None;
      std::chrono::milliseconds backoff{ 0 };
      if (provider.isOnline()) {
        answer = Signal::Online;
      } else if (!provider.shouldRetry()) {
        answer = Signal::NotOnline;
      } else {
        backoff = std::clamp(provider.backoffDuration(), std::chrono::milliseconds::zero(),
                             kMaxBackoff);
      }

      std::unique_lock<std::mutex> lk(rv.mtx);
      rv.polling = false;
      rv.signal = answer;
      rv.cv.notify_all();
      if (answer != Signal::None)
        return;

      // interrupted by request_stop(); the predicate never ends the sleep early
      rv.cv.wait_for(lk, stop, backoff, [] { return false; });
    }
  }

} // namespace

namespace ember::core {

  void waitForProvider(Provider& provider, std::chrono::milliseconds timeout) {
    Rendezvous rv;
    Signal outcome{ Signal::None };

    {
      std::jthread poller(pollProvider, std::ref(provider), std::ref(rv));

      std::unique_lock<std::mutex> lk(rv.mtx);
      auto reported = [&rv] { return rv.signal != Signal::None; };
      if (auto deadline = deadlineAfter(timeout)) {
        // a round already in flight at the deadline still gets to answer
        if (!rv.cv.wait_until(lk, *deadline, reported))
          rv.cv.wait(lk, [&rv] { return rv.signal != Signal::None || !rv.polling; });
      } else {
        rv.cv.wait(lk, reported);
      }
      outcome = rv.signal;
      rv.decided = true;
      lk.unlock();

      poller.request_stop();
    } // joins the poller

    switch (outcome) {
    case Signal::Online:
      return;
    case Signal::NotOnline:
      throw ProvisionError(ErrorKind::NotOnline, "config provider was not online");
    case Signal::None:
      throw ProvisionError(ErrorKind::TimedOut,
                           "timed out while waiting for config provider to come online");
    }
  }

} // namespace ember::core
