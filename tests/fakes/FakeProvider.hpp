#pragma once
/** @file  FakeProvider.hpp
 *  @brief Provider derivative with scripted answers and call counters for waiter/engine testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/Config.hpp"
#include "core/Errors.hpp"
#include "providers/Provider.hpp"

namespace ember {
  namespace test {

    /**
 * @class FakeProvider
 * @brief Set the public knobs before handing it to the code under test;
 *        counters are atomic because the waiter polls from its own thread.
 */
    class FakeProvider : public ember::providers::Provider {
    public:
      bool online = false;
      int onlineAtPoll = 0; ///< >0: isOnline() turns true on this (1-based) poll
      bool retry = true;
      std::chrono::milliseconds backoff{ 10 };
      std::chrono::milliseconds pollDelay{ 0 }; ///< time each isOnline() takes
      config::Config document{ .ignitionVersion = 1 };
      std::optional<core::ErrorKind> fetchError;
      std::optional<std::string> fetchCrash; ///< fetchConfig() throws std::runtime_error

      std::atomic<int> isOnlineCalls{ 0 };
      std::atomic<int> shouldRetryCalls{ 0 };
      std::atomic<int> backoffCalls{ 0 };
      std::atomic<int> fetchCalls{ 0 };

      std::string name() const override { return "fake"; }

      bool isOnline() override {
        record("isOnline");
        int poll = ++isOnlineCalls;
        if (pollDelay > std::chrono::milliseconds::zero())
          std::this_thread::sleep_for(pollDelay);
        return online || (onlineAtPoll > 0 && poll >= onlineAtPoll);
      }

      bool shouldRetry() override {
        record("shouldRetry");
        ++shouldRetryCalls;
        return retry;
      }

      std::chrono::milliseconds backoffDuration() override {
        record("backoffDuration");
        ++backoffCalls;
        return backoff;
      }

      config::Config fetchConfig() override {
        record("fetchConfig");
        ++fetchCalls;
        if (fetchCrash)
          throw std::runtime_error(*fetchCrash);
        if (fetchError)
          throw core::ProvisionError(*fetchError, std::string("fake fetch: ") + core::toString(*fetchError));
        return document;
      }

      int totalPolls() const {
        return isOnlineCalls.load() + shouldRetryCalls.load() + backoffCalls.load();
      }

      /// Provider methods in the order they were called.
      std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lk(callsMtx_);
        return calls_;
      }

    private:
      void record(const char* method) {
        std::lock_guard<std::mutex> lk(callsMtx_);
        calls_.emplace_back(method);
      }

      mutable std::mutex callsMtx_;
      std::vector<std::string> calls_;
    };

  } // namespace test
} // namespace ember
