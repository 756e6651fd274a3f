// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file drain.hpp
/// @brief Caller-side flush loop built on BatchAccumulator::flush()
///
/// Calls flush() until the queue is empty. After a flush with rejected
/// records it sleeps, so a throttled stream is not hammered; leftovers from
/// a fully accepted batch are sent immediately. Transport exceptions propagate.

#include "batch_accumulator.hpp"

#include <chrono>
#include <cstddef>
#include <functional>

namespace streamwriter::batching {

struct DrainOptions {
    /// Delay after a flush in which the transport rejected records
    std::chrono::milliseconds interval{2000};

    /// Give up after this many flushes (0 = until drained)
    size_t max_flushes = 0;

    /// Checked before every flush; returning true stops with drained = false
    std::function<bool()> should_stop;
};

struct DrainResult {
    size_t flushes = 0;
    bool drained = false;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper backed by std::this_thread::sleep_for
Sleeper thread_sleeper();

/// Flush until drained, max_flushes reached, or should_stop returns true
DrainResult drain(BatchAccumulator& accumulator,
                  const DrainOptions& options = {},
                  const Sleeper& sleep = thread_sleeper());

}  // namespace streamwriter::batching
