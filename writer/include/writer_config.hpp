// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file writer_config.hpp
/// @brief YAML configuration for the stream writer
///
/// Example:
/// @code{.yaml}
///   stream: arn:aws:kinesis:us-east-2:123456789012:stream/example
///   log_batches: true
///   batching:
///     max_records: 500
///     max_bytes: 5242880
///     max_record_bytes: 1048576
///     max_partition_key_bytes: 256
///     record_overhead_bytes: 0
///   drain:
///     interval_ms: 2000
///     max_flushes: 0
/// @endcode
///
/// Missing keys keep their defaults; unknown keys are ignored.

#include "batch_limits.hpp"
#include "drain.hpp"

#include <optional>
#include <string>

namespace YAML {
class Node;
}

namespace streamwriter::batching {

struct WriterConfig {
    std::string stream;
    BatchLimits limits;
    bool log_batches = false;
    DrainOptions drain;
};

/// Overlay values from a parsed YAML document onto @p base
/// @return nullopt (with an error logged) on wrong types or invalid limits
std::optional<WriterConfig> parse_writer_config(const YAML::Node& root,
                                                const WriterConfig& base = {});

/// Load and parse a YAML file
/// @return nullopt (with an error logged) if unreadable or invalid
std::optional<WriterConfig> load_writer_config(const std::string& path,
                                               const WriterConfig& base = {});

}  // namespace streamwriter::batching
