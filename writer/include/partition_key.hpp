// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file partition_key.hpp
/// @brief Default partition keys for records enqueued without one

#include <chrono>
#include <functional>
#include <string>

namespace streamwriter::batching {

/// Produces a partition key; called once per keyless enqueue
using PartitionKeyGenerator = std::function<std::string()>;

/// Format a point in time as decimal epoch seconds with microsecond fraction
/// (e.g. "1697581234.123456")
std::string epoch_seconds_key(std::chrono::system_clock::time_point when);

/// Generator that reads std::chrono::system_clock on every call
PartitionKeyGenerator system_clock_key_generator();

}  // namespace streamwriter::batching
