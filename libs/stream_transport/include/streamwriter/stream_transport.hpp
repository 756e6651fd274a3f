// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file stream_transport.hpp
/// @brief Abstract interface for sharded stream transports
///
/// StreamTransport decouples record submission from batching logic.
/// A transport accepts a bounded list of records for one stream and reports,
/// positionally, whether each record was accepted or rejected:
/// - KinesisStreamTransport: PutRecords via the AWS SDK
/// - ConsoleStreamTransport: JSON lines on an ostream (dry run)

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace streamwriter {

// =============================================================================
// Records and Outcomes
// =============================================================================

/// One record as submitted to the stream
struct StreamRecord {
    std::vector<uint8_t> data;
    std::string partition_key;
};

/// Per-record result of a batch submission
///
/// Aligned positionally with the submitted records.
struct RecordOutcome {
    bool accepted = false;

    // Set when accepted
    std::string shard_id;
    std::string sequence_number;

    // Set when rejected
    std::string error_code;
    std::string error_message;

    static RecordOutcome success(std::string shard_id, std::string sequence_number) {
        RecordOutcome outcome;
        outcome.accepted = true;
        outcome.shard_id = std::move(shard_id);
        outcome.sequence_number = std::move(sequence_number);
        return outcome;
    }

    static RecordOutcome failure(std::string error_code, std::string error_message) {
        RecordOutcome outcome;
        outcome.error_code = std::move(error_code);
        outcome.error_message = std::move(error_message);
        return outcome;
    }
};

/// Whole-call failure (connectivity, credentials, missing stream)
///
/// Thrown by put_records() when no per-record result is available.
class StreamTransportError : public std::runtime_error {
public:
    StreamTransportError(const std::string& error_code, const std::string& message)
        : std::runtime_error(error_code.empty() ? message : error_code + ": " + message)
        , error_code_(error_code) {
    }

    const std::string& error_code() const { return error_code_; }

private:
    std::string error_code_;
};

/// Transport statistics
struct TransportStats {
    uint64_t calls = 0;
    uint64_t records_accepted = 0;
    uint64_t records_rejected = 0;
    uint64_t bytes_accepted = 0;
    int64_t last_call_timestamp_ns = 0;
};

// =============================================================================
// StreamTransport Interface
// =============================================================================

/// Abstract interface for stream transports.
///
/// Implementations perform the actual delivery. They receive already
/// serialized records and never reorder them.
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    /// Submit a batch of records to a stream
    /// @param stream Stream name or ARN (opaque to the caller)
    /// @param records Records to submit, in order
    /// @return One outcome per record, same order as @p records
    /// @throws StreamTransportError if the call as a whole fails
    virtual std::vector<RecordOutcome> put_records(
        const std::string& stream,
        const std::vector<StreamRecord>& records) = 0;

    /// Get statistics
    virtual TransportStats stats() const = 0;

    /// Get transport name for logging
    virtual std::string name() const = 0;
};

/// True if the stream identifier is an ARN rather than a plain name
bool is_stream_arn(const std::string& stream);

/// Short name for logging: the plain name, or the name portion of an ARN
/// (e.g. "arn:aws:kinesis:us-east-2:123456789012:stream/example" -> "example")
std::string stream_display_name(const std::string& stream);

}  // namespace streamwriter
