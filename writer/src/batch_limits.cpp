// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "batch_limits.hpp"

namespace streamwriter::batching {

bool validate(const BatchLimits& limits, const char** error) {
    const char* problem = nullptr;

    if (limits.max_records_per_batch == 0) {
        problem = "max_records_per_batch must be positive";
    } else if (limits.max_bytes_per_batch == 0) {
        problem = "max_bytes_per_batch must be positive";
    } else if (limits.max_record_bytes == 0) {
        problem = "max_record_bytes must be positive";
    } else if (limits.max_partition_key_bytes == 0) {
        problem = "max_partition_key_bytes must be positive";
    } else if (limits.max_record_bytes > limits.max_bytes_per_batch) {
        problem = "max_record_bytes must not exceed max_bytes_per_batch";
    }

    if (error) {
        *error = problem;
    }
    return problem == nullptr;
}

}  // namespace streamwriter::batching
