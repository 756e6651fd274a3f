// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "streamwriter/console_stream_transport.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include <chrono>

namespace streamwriter {

using json = nlohmann::json;

ConsoleStreamTransport::ConsoleStreamTransport(std::ostream& out, std::string shard_id)
    : out_(out)
    , shard_id_(std::move(shard_id)) {
}

std::vector<RecordOutcome> ConsoleStreamTransport::put_records(
    const std::string& stream,
    const std::vector<StreamRecord>& records) {
    std::vector<RecordOutcome> outcomes;
    outcomes.reserve(records.size());

    uint64_t bytes = 0;
    for (const auto& record : records) {
        std::string sequence_number = std::to_string(next_sequence_++);

        json line;
        line["stream"] = stream;
        line["partition_key"] = record.partition_key;
        line["data"] = std::string(record.data.begin(), record.data.end());
        line["shard_id"] = shard_id_;
        line["sequence_number"] = sequence_number;

        // Payloads are opaque bytes; invalid UTF-8 is replaced rather than thrown
        out_ << line.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';

        bytes += record.data.size();
        outcomes.push_back(RecordOutcome::success(shard_id_, std::move(sequence_number)));
    }
    out_.flush();

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.calls++;
        stats_.records_accepted += records.size();
        stats_.bytes_accepted += bytes;
        stats_.last_call_timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    VLOG(2) << "Wrote " << records.size() << " records for " << stream_display_name(stream);
    return outcomes;
}

TransportStats ConsoleStreamTransport::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace streamwriter
