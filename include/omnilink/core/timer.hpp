// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "omnilink/core/logger.hpp"

namespace omnilink
{
namespace core
{

/// \brief Single-threaded one-shot timer service. Handlers run on the
/// service thread, never while the service mutex is held.
class TimerService
{
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Duration = Clock::duration;
  using Handler = std::function<void()>;

  /// \brief Start the service thread.
  explicit TimerService(std::string name = "omnilink-timer") : _name(std::move(name))
  {
    _thread = std::thread([this]() { run(); });
  }

  /// \brief Stop the service and join the thread.
  ~TimerService() { stop(); }

  TimerService(const TimerService &) = delete;
  TimerService &operator=(const TimerService &) = delete;

  /// \brief Schedule handler at absolute time. Returns the timer id, or 0 if
  /// the service is stopped.
  std::uint64_t scheduleAt(TimePoint tp, Handler handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopping)
    {
      OMNILINK_LOG_DEBUG(_name << ": rejecting timer, service stopped");
      return 0;
    }

    std::uint64_t id = ++_nextId;
    _records.emplace(id, std::move(handler));
    _heap.push_back(HeapItem{tp, id});
    std::push_heap(_heap.begin(), _heap.end(), Later{});
    _cv.notify_one();
    return id;
  }

  /// \brief Schedule handler after duration.
  std::uint64_t scheduleAfter(Duration d, Handler handler)
  {
    return scheduleAt(Clock::now() + d, std::move(handler));
  }

  /// \brief Cancel a scheduled timer; returns true if it was still pending.
  bool cancel(std::uint64_t id)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _records.erase(id) > 0;
  }

  /// \brief Number of timers scheduled but not yet fired or cancelled.
  std::size_t pendingCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _records.size();
  }

  /// \brief Drop all pending timers and join the service thread. Safe to
  /// call more than once; must not be called from a timer handler.
  void stop()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_stopping && !_thread.joinable())
      {
        return;
      }
      _stopping = true;
      _records.clear();
      _heap.clear();
    }
    _cv.notify_all();
    if (_thread.joinable())
    {
      if (_thread.get_id() == std::this_thread::get_id())
      {
        _thread.detach();
      }
      else
      {
        _thread.join();
      }
    }
  }

private:
  struct HeapItem
  {
    TimePoint when;
    std::uint64_t id;
  };

  struct Later
  {
    bool operator()(const HeapItem &a, const HeapItem &b) const { return a.when > b.when; }
  };

  void run()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_stopping)
    {
      if (_heap.empty())
      {
        _cv.wait(lock, [this]() { return _stopping || !_heap.empty(); });
        continue;
      }

      auto next = _heap.front();
      if (Clock::now() < next.when)
      {
        _cv.wait_until(lock, next.when);
        continue;
      }

      std::pop_heap(_heap.begin(), _heap.end(), Later{});
      _heap.pop_back();

      auto it = _records.find(next.id);
      if (it == _records.end())
      {
        // cancelled
        continue;
      }
      Handler handler = std::move(it->second);
      _records.erase(it);

      lock.unlock();
      try
      {
        handler();
      }
      catch (const std::exception &e)
      {
        OMNILINK_LOG_ERROR(_name << ": timer " << next.id << " handler threw: " << e.what());
      }
      lock.lock();
    }
  }

  std::string _name;
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::vector<HeapItem> _heap;
  std::unordered_map<std::uint64_t, Handler> _records;
  std::uint64_t _nextId{0};
  bool _stopping{false};
  std::thread _thread;
};

} // namespace core
} // namespace omnilink
