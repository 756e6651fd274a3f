// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file line_publisher.hpp
/// @brief Feeds newline-delimited messages into a BatchAccumulator
///
/// Each non-empty line becomes one record. A batch is sent as soon as a full
/// one is queued, so memory stays bounded on long inputs. When that batch had
/// rejected records the publisher sleeps before reading on, so a throttled
/// stream sees at most one request per backoff interval.
///
/// Leftovers are not sent; follow with drain().

#include "batch_accumulator.hpp"
#include "drain.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace streamwriter::batching {

struct PublishOptions {
    /// Key for every record (default: generated per record)
    std::optional<std::string> partition_key;

    /// Parse each line as JSON and send its compact form
    bool json = false;

    /// Delay after an in-stream flush with rejected records
    std::chrono::milliseconds backoff{2000};

    /// Checked before every line; returning true stops reading
    std::function<bool()> should_stop;
};

struct PublishResult {
    size_t lines = 0;      ///< Non-empty lines read
    size_t enqueued = 0;
    size_t skipped = 0;    ///< Invalid JSON or refused by the accumulator
    size_t flushes = 0;
    bool stopped = false;  ///< should_stop ended the input early
};

/// Read @p in to the end (or until stopped), enqueueing every line
/// @throws StreamTransportError from an in-stream flush
PublishResult publish_lines(std::istream& in,
                            BatchAccumulator& accumulator,
                            const PublishOptions& options = {},
                            const Sleeper& sleep = thread_sleeper());

}  // namespace streamwriter::batching
