// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_accumulator.hpp
/// @brief Batching write path with partial-failure requeue
///
/// BatchAccumulator buffers records, submits them in count- and size-bounded
/// batches, and puts every record the transport rejects back at the head of
/// the queue so it is retried before anything newer.
///
/// The caller drives it: enqueue() never sends, flush() sends one batch.
/// @code
///   BatchAccumulator writer(transport, "example");
///   writer.enqueue(Payload::text("message 1"), "argle");
///   writer.enqueue(Payload::text("message 2"));
///   while (writer.flush()) {
///       std::this_thread::sleep_for(std::chrono::milliseconds(200));
///   }
/// @endcode
///
/// Not thread-safe: enqueue() and flush() must be serialized by the caller.
///
/// If the transport throws from put_records(), the exception propagates and
/// the records of that batch are not requeued; they are lost unless the
/// caller re-enqueues them. in_flight() reports how many were lost.

#include "batch_limits.hpp"
#include "partition_key.hpp"
#include "payload.hpp"
#include "record_errors.hpp"
#include "streamwriter/stream_transport.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace streamwriter::batching {

/// Summary of the most recent flush that called the transport
struct LastBatch {
    size_t size = 0;
    size_t success_count = 0;
    std::set<std::string> failure_messages;
};

/// Cumulative counters
struct AccumulatorStats {
    uint64_t records_enqueued = 0;
    uint64_t records_refused = 0;    ///< Rejected at enqueue (too large)
    uint64_t records_accepted = 0;
    uint64_t records_requeued = 0;   ///< Each rejection counts once
    uint64_t batches_submitted = 0;
    uint64_t bytes_accepted = 0;     ///< Encoded size of accepted records
};

class BatchAccumulator {
public:
    /// @param transport Transport used by flush() (must outlive the accumulator)
    /// @param stream Stream name or ARN, passed through to the transport
    /// @param limits Transport limits; throws std::invalid_argument if invalid
    /// @param log_batches Log one line before and one after each transport call
    /// @param key_generator Source of keys for records enqueued without one
    BatchAccumulator(StreamTransport& transport,
                     std::string stream,
                     const BatchLimits& limits = {},
                     bool log_batches = false,
                     PartitionKeyGenerator key_generator = system_clock_key_generator());

    BatchAccumulator(const BatchAccumulator&) = delete;
    BatchAccumulator& operator=(const BatchAccumulator&) = delete;

    /// Add a record to the tail of the queue
    /// @param payload Message, serialized now
    /// @param partition_key Shard routing key; generated if absent or empty
    /// @throws PartitionKeyTooLargeError, RecordTooLargeError (queue unchanged)
    void enqueue(const Payload& payload,
                 std::optional<std::string> partition_key = std::nullopt);

    /// Submit one batch from the head of the queue
    /// @return true if records remain queued (call again), false if drained
    /// @throws whatever the transport throws; the batch is not requeued
    bool flush();

    /// @name Queue state
    /// @{
    bool empty() const { return queue_.empty(); }
    size_t size() const { return queue_.size(); }
    size_t queued_bytes() const { return queued_bytes_; }

    /// Queued records in send order
    const std::deque<StreamRecord>& pending() const { return queue_; }

    /// Records handed to the transport by a flush() that has not returned.
    /// Non-zero after put_records() threw: those records were dropped.
    size_t in_flight() const { return in_flight_; }
    /// @}

    const std::string& stream() const { return stream_; }
    const std::string& stream_name() const { return stream_name_; }
    bool is_arn() const { return is_stream_arn(stream_); }

    const BatchLimits& limits() const { return limits_; }
    const LastBatch& last_batch() const { return last_batch_; }
    const AccumulatorStats& stats() const { return stats_; }

private:
    size_t encoded_size(const StreamRecord& record) const {
        return limits_.encoded_size(record.data.size(), record.partition_key.size());
    }

    /// Move the longest prefix of the queue that fits the limits into a batch
    std::vector<StreamRecord> take_batch();

    /// Requeue rejected records at the head, update last batch and stats
    void process_outcomes(std::vector<StreamRecord>& batch,
                          const std::vector<RecordOutcome>& outcomes);

    StreamTransport& transport_;
    std::string stream_;
    std::string stream_name_;
    BatchLimits limits_;
    bool log_batches_;
    PartitionKeyGenerator key_generator_;

    std::deque<StreamRecord> queue_;
    size_t queued_bytes_ = 0;
    size_t in_flight_ = 0;

    LastBatch last_batch_;
    AccumulatorStats stats_;
};

}  // namespace streamwriter::batching
