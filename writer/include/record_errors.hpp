// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file record_errors.hpp
/// @brief Errors raised when a record cannot be admitted to the queue

#include <cstddef>
#include <stdexcept>
#include <string>

namespace streamwriter::batching {

/// Base class for records refused at enqueue time
class RecordRejectedError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Encoded record exceeds the transport's single-record ceiling
class RecordTooLargeError : public RecordRejectedError {
public:
    RecordTooLargeError(size_t record_size, size_t data_size, size_t key_size, size_t limit);

    size_t record_size() const { return record_size_; }
    size_t limit() const { return limit_; }

private:
    size_t record_size_;
    size_t limit_;
};

/// Partition key exceeds the transport's key length ceiling (UTF-8 bytes)
class PartitionKeyTooLargeError : public RecordRejectedError {
public:
    PartitionKeyTooLargeError(size_t key_size, size_t limit);

    size_t key_size() const { return key_size_; }
    size_t limit() const { return limit_; }

private:
    size_t key_size_;
    size_t limit_;
};

}  // namespace streamwriter::batching
