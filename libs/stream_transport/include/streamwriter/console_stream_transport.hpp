// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file console_stream_transport.hpp
/// @brief Dry-run transport that prints records as JSON lines
///
/// Every record is accepted and written to the output stream as one JSON
/// object per line:
///   {"stream":"...","partition_key":"...","data":"...","shard_id":"...","sequence_number":"..."}

#include "streamwriter/stream_transport.hpp"

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace streamwriter {

class ConsoleStreamTransport : public StreamTransport {
public:
    /// @param out Destination for JSON lines (must outlive the transport)
    /// @param shard_id Shard id reported for every accepted record
    explicit ConsoleStreamTransport(std::ostream& out,
                                    std::string shard_id = "shardId-000000000000");

    ConsoleStreamTransport(const ConsoleStreamTransport&) = delete;
    ConsoleStreamTransport& operator=(const ConsoleStreamTransport&) = delete;

    std::vector<RecordOutcome> put_records(
        const std::string& stream,
        const std::vector<StreamRecord>& records) override;

    TransportStats stats() const override;
    std::string name() const override { return "console"; }

private:
    std::ostream& out_;
    std::string shard_id_;
    uint64_t next_sequence_ = 1;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;
};

}  // namespace streamwriter
