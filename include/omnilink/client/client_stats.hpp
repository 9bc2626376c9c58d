// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cstdint>

namespace omnilink
{
namespace client
{

/// \brief Client-level counters.
struct ClientStats
{
  std::atomic<std::uint64_t> totalCalls{0};
  std::atomic<std::uint64_t> succeededCalls{0};
  std::atomic<std::uint64_t> failedCalls{0};
  std::atomic<std::uint64_t> timedOutCalls{0};
  std::atomic<std::uint64_t> remoteErrors{0};
  std::atomic<std::uint64_t> notConnected{0};
  std::atomic<std::uint64_t> sendFailures{0};
  std::atomic<std::uint64_t> malformedFrames{0};
  std::atomic<std::uint64_t> reconnectsScheduled{0};
  std::atomic<std::uint64_t> connectionsOpened{0};

  /// \brief Reset all counters.
  void reset()
  {
    totalCalls = 0;
    succeededCalls = 0;
    failedCalls = 0;
    timedOutCalls = 0;
    remoteErrors = 0;
    notConnected = 0;
    sendFailures = 0;
    malformedFrames = 0;
    reconnectsScheduled = 0;
    connectionsOpened = 0;
  }
};

} // namespace client
} // namespace omnilink
