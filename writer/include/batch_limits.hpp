// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_limits.hpp
/// @brief Per-call limits of the stream transport
///
/// Defaults mirror Kinesis PutRecords: 500 records and 5 MiB per call,
/// 1 MiB per record (data plus partition key), 256-byte partition keys.

#include <cstddef>

namespace streamwriter::batching {

struct BatchLimits {
    size_t max_records_per_batch = 500;
    size_t max_bytes_per_batch = 5 * 1024 * 1024;
    size_t max_record_bytes = 1024 * 1024;
    size_t max_partition_key_bytes = 256;

    /// Fixed per-record envelope cost added to data + key size
    size_t record_overhead_bytes = 0;

    /// Encoded size of a record as the transport accounts for it
    size_t encoded_size(size_t data_bytes, size_t key_bytes) const {
        return data_bytes + key_bytes + record_overhead_bytes;
    }
};

/// Check that limits are usable: every limit positive and a single
/// maximum-size record fits in a batch
/// @param error Set to a description of the first problem found
bool validate(const BatchLimits& limits, const char** error = nullptr);

}  // namespace streamwriter::batching
