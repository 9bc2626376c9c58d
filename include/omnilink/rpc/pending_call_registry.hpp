// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "omnilink/core/json.hpp"
#include "omnilink/core/logger.hpp"
#include "omnilink/rpc/errors.hpp"

namespace omnilink
{
namespace rpc
{

/// \brief Table of outstanding calls keyed by correlation id.
///
/// Every registered call is completed exactly once: by resolve(), reject(),
/// rejectAll() or expire(), after which its id is free for reuse. The table is
/// guarded by one mutex and completion handlers always run after the entry has
/// been removed and the mutex released, so a handler may call back into the
/// registry.
///
/// An optional sweeper thread wakes at the earliest deadline (bounded by the
/// sweep interval) and calls expire().
class PendingCallRegistry
{
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using SuccessHandler = std::function<void(core::Json)>;
  using FailureHandler = std::function<void(std::exception_ptr)>;

  struct Options
  {
    bool enableSweeper{true};
    std::chrono::milliseconds sweepInterval{250};
  };

  PendingCallRegistry() : PendingCallRegistry(Options{}) {}

  explicit PendingCallRegistry(Options options) : _options(options)
  {
    if (_options.sweepInterval <= std::chrono::milliseconds::zero())
    {
      _options.sweepInterval = std::chrono::milliseconds(250);
    }
    if (_options.enableSweeper)
    {
      _sweeper = std::thread([this]() { sweepLoop(); });
    }
  }

  ~PendingCallRegistry()
  {
    stopSweeper();
    rejectAll(std::make_exception_ptr(DisconnectedError("Pending call registry destroyed")));
  }

  PendingCallRegistry(const PendingCallRegistry &) = delete;
  PendingCallRegistry &operator=(const PendingCallRegistry &) = delete;

  /// \brief Track a new call.
  /// \throws DuplicateIdError if \p id is already outstanding
  void registerCall(const std::string &id, TimePoint deadline, SuccessHandler onSuccess,
                    FailureHandler onFailure)
  {
    bool earliest = false;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_calls.find(id) != _calls.end())
      {
        throw DuplicateIdError(id);
      }
      earliest = _deadlines.empty() || deadline < _deadlines.begin()->first;
      auto deadlineIt = _deadlines.emplace(deadline, id);
      Entry entry;
      entry.createdAt = Clock::now();
      entry.deadline = deadline;
      entry.onSuccess = std::move(onSuccess);
      entry.onFailure = std::move(onFailure);
      entry.deadlineIt = deadlineIt;
      _calls.emplace(id, std::move(entry));
    }
    if (earliest)
    {
      _cv.notify_one();
    }
  }

  /// \brief Track a new call whose completion is delivered through a future.
  /// \throws DuplicateIdError if \p id is already outstanding
  std::future<core::Json> registerCall(const std::string &id, TimePoint deadline)
  {
    auto promise = std::make_shared<std::promise<core::Json>>();
    auto future = promise->get_future();
    registerCall(
      id, deadline, [promise](core::Json result) { promise->set_value(std::move(result)); },
      [promise](std::exception_ptr error) { promise->set_exception(error); });
    return future;
  }

  /// \brief Complete \p id successfully. Unknown ids are discarded.
  /// \return true if a pending call was completed
  bool resolve(const std::string &id, core::Json result)
  {
    auto entry = take(id);
    if (!entry)
    {
      OMNILINK_LOG_DEBUG("PendingCallRegistry: discarding result for unknown id " << id);
      return false;
    }
    complete(id, *entry, std::move(result));
    return true;
  }

  /// \brief Fail \p id with \p error. Unknown ids are discarded.
  bool reject(const std::string &id, std::exception_ptr error)
  {
    auto entry = take(id);
    if (!entry)
    {
      OMNILINK_LOG_DEBUG("PendingCallRegistry: discarding error for unknown id " << id);
      return false;
    }
    fail(id, *entry, std::move(error));
    return true;
  }

  /// \brief Fail every outstanding call with \p error and clear the table.
  /// \return number of calls failed
  std::size_t rejectAll(std::exception_ptr error)
  {
    std::unordered_map<std::string, Entry> drained;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      drained.swap(_calls);
      _deadlines.clear();
    }
    for (auto &kv : drained)
    {
      fail(kv.first, kv.second, error);
    }
    if (!drained.empty())
    {
      OMNILINK_LOG_DEBUG("PendingCallRegistry: rejected " << drained.size() << " pending call(s)");
    }
    return drained.size();
  }

  /// \brief Fail with TimeoutError every call whose deadline is <= \p now.
  /// \return number of calls expired
  std::size_t expire(TimePoint now)
  {
    std::vector<std::pair<std::string, Entry>> expired;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto end = _deadlines.upper_bound(now);
      for (auto it = _deadlines.begin(); it != end; ++it)
      {
        auto callIt = _calls.find(it->second);
        if (callIt != _calls.end())
        {
          expired.emplace_back(callIt->first, std::move(callIt->second));
          _calls.erase(callIt);
        }
      }
      _deadlines.erase(_deadlines.begin(), end);
    }
    for (auto &kv : expired)
    {
      auto waited =
        std::chrono::duration_cast<std::chrono::milliseconds>(kv.second.deadline - kv.second.createdAt);
      OMNILINK_LOG_DEBUG("PendingCallRegistry: call " << kv.first << " timed out after "
                                                     << waited.count() << "ms");
      fail(kv.first, kv.second,
           std::make_exception_ptr(TimeoutError("Request timeout: no response within " +
                                                std::to_string(waited.count()) + "ms")));
    }
    return expired.size();
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _calls.size();
  }

  bool contains(const std::string &id) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _calls.find(id) != _calls.end();
  }

  /// \brief Stop the sweeper thread. Outstanding calls remain and can still
  /// be expired manually.
  void stopSweeper()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _stop = true;
    }
    _cv.notify_all();
    if (_sweeper.joinable())
    {
      _sweeper.join();
    }
  }

private:
  using DeadlineIndex = std::multimap<TimePoint, std::string>;

  struct Entry
  {
    TimePoint createdAt;
    TimePoint deadline;
    SuccessHandler onSuccess;
    FailureHandler onFailure;
    DeadlineIndex::iterator deadlineIt;
  };

  std::unique_ptr<Entry> take(const std::string &id)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _calls.find(id);
    if (it == _calls.end())
    {
      return nullptr;
    }
    auto entry = std::make_unique<Entry>(std::move(it->second));
    _deadlines.erase(entry->deadlineIt);
    _calls.erase(it);
    return entry;
  }

  static void complete(const std::string &id, Entry &entry, core::Json result)
  {
    if (!entry.onSuccess)
    {
      return;
    }
    try
    {
      entry.onSuccess(std::move(result));
    }
    catch (const std::exception &e)
    {
      OMNILINK_LOG_ERROR("PendingCallRegistry: success handler for " << id << " threw: " << e.what());
    }
  }

  static void fail(const std::string &id, Entry &entry, std::exception_ptr error)
  {
    if (!entry.onFailure)
    {
      return;
    }
    try
    {
      entry.onFailure(std::move(error));
    }
    catch (const std::exception &e)
    {
      OMNILINK_LOG_ERROR("PendingCallRegistry: failure handler for " << id << " threw: " << e.what());
    }
  }

  void sweepLoop()
  {
    OMNILINK_LOG_DEBUG("PendingCallRegistry: sweeper started");
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_stop)
    {
      auto wakeAt = Clock::now() + _options.sweepInterval;
      if (!_deadlines.empty())
      {
        wakeAt = std::min(wakeAt, _deadlines.begin()->first);
      }
      _cv.wait_until(lock, wakeAt);
      if (_stop)
      {
        break;
      }
      bool due = !_deadlines.empty() && _deadlines.begin()->first <= Clock::now();
      if (due)
      {
        lock.unlock();
        expire(Clock::now());
        lock.lock();
      }
    }
    OMNILINK_LOG_DEBUG("PendingCallRegistry: sweeper stopping");
  }

  Options _options;
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::unordered_map<std::string, Entry> _calls;
  DeadlineIndex _deadlines;
  bool _stop{false};
  std::thread _sweeper;
};

} // namespace rpc
} // namespace omnilink
