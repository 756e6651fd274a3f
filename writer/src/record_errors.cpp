// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "record_errors.hpp"

namespace streamwriter::batching {

RecordTooLargeError::RecordTooLargeError(size_t record_size, size_t data_size,
                                         size_t key_size, size_t limit)
    : RecordRejectedError("message too large: " + std::to_string(record_size) +
                          " (base message length = " + std::to_string(data_size) +
                          ", partition key length = " + std::to_string(key_size) +
                          ", limit = " + std::to_string(limit) + ")")
    , record_size_(record_size)
    , limit_(limit) {
}

PartitionKeyTooLargeError::PartitionKeyTooLargeError(size_t key_size, size_t limit)
    : RecordRejectedError("partition key too large: " + std::to_string(key_size) +
                          " (limit = " + std::to_string(limit) + ")")
    , key_size_(key_size)
    , limit_(limit) {
}

}  // namespace streamwriter::batching
