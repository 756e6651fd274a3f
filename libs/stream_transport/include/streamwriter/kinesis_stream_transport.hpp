// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file kinesis_stream_transport.hpp
/// @brief Kinesis Data Streams transport (PutRecords via AWS SDK for C++)
///
/// Stream identifiers starting with "arn:" are sent as StreamARN, all others
/// as StreamName. Per-record ErrorCode/ErrorMessage become rejected outcomes;
/// a failed PutRecords call throws StreamTransportError.
///
/// Aws::InitAPI() must have been called before constructing the transport.

#include "streamwriter/stream_transport.hpp"

#include <memory>
#include <mutex>
#include <string>

// Forward declarations (AWS SDK types)
namespace Aws::Kinesis {
class KinesisClient;
namespace Model {
class PutRecordsResult;
}
}

namespace streamwriter {

/// Configuration for the Kinesis transport
struct KinesisTransportConfig {
    std::string region;             // empty: SDK default chain
    std::string endpoint_override;  // e.g. LocalStack; empty: AWS endpoint
    long request_timeout_ms = 3000;
    long connect_timeout_ms = 1000;
};

/// Positional outcomes for a PutRecords response
///
/// Entries with an ErrorCode are rejected (ErrorCode/ErrorMessage carried
/// over); all others are accepted with their ShardId and SequenceNumber.
std::vector<RecordOutcome> to_record_outcomes(const Aws::Kinesis::Model::PutRecordsResult& result);

class KinesisStreamTransport : public StreamTransport {
public:
    explicit KinesisStreamTransport(const KinesisTransportConfig& config = {});
    ~KinesisStreamTransport() override;

    KinesisStreamTransport(const KinesisStreamTransport&) = delete;
    KinesisStreamTransport& operator=(const KinesisStreamTransport&) = delete;

    std::vector<RecordOutcome> put_records(
        const std::string& stream,
        const std::vector<StreamRecord>& records) override;

    TransportStats stats() const override;
    std::string name() const override { return "kinesis"; }

private:
    KinesisTransportConfig config_;
    std::unique_ptr<Aws::Kinesis::KinesisClient> client_;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;
};

}  // namespace streamwriter
