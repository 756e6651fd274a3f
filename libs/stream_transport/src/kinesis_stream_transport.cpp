// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "streamwriter/kinesis_stream_transport.hpp"

#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/memory/stl/AWSString.h>
#include <aws/kinesis/KinesisClient.h>
#include <aws/kinesis/model/PutRecordsRequest.h>
#include <aws/kinesis/model/PutRecordsRequestEntry.h>
#include <aws/kinesis/model/PutRecordsResult.h>
#include <aws/kinesis/model/PutRecordsResultEntry.h>
#include <glog/logging.h>

#include <chrono>

namespace streamwriter {

std::vector<RecordOutcome> to_record_outcomes(const Aws::Kinesis::Model::PutRecordsResult& result) {
    std::vector<RecordOutcome> outcomes;
    outcomes.reserve(result.GetRecords().size());

    for (const auto& entry : result.GetRecords()) {
        if (!entry.GetErrorCode().empty()) {
            outcomes.push_back(RecordOutcome::failure(entry.GetErrorCode(), entry.GetErrorMessage()));
        } else {
            outcomes.push_back(RecordOutcome::success(entry.GetShardId(), entry.GetSequenceNumber()));
        }
    }
    return outcomes;
}

KinesisStreamTransport::KinesisStreamTransport(const KinesisTransportConfig& config)
    : config_(config) {
    Aws::Client::ClientConfiguration client_config;
    if (!config_.region.empty()) {
        client_config.region = config_.region;
    }
    if (!config_.endpoint_override.empty()) {
        client_config.endpointOverride = config_.endpoint_override;
    }
    client_config.requestTimeoutMs = config_.request_timeout_ms;
    client_config.connectTimeoutMs = config_.connect_timeout_ms;

    client_ = std::make_unique<Aws::Kinesis::KinesisClient>(client_config);

    LOG(INFO) << "KinesisStreamTransport created"
              << (config_.region.empty() ? "" : ", region " + config_.region)
              << (config_.endpoint_override.empty() ? "" : ", endpoint " + config_.endpoint_override);
}

KinesisStreamTransport::~KinesisStreamTransport() = default;

std::vector<RecordOutcome> KinesisStreamTransport::put_records(
    const std::string& stream,
    const std::vector<StreamRecord>& records) {
    Aws::Kinesis::Model::PutRecordsRequest request;
    if (is_stream_arn(stream)) {
        request.SetStreamARN(stream);
    } else {
        request.SetStreamName(stream);
    }

    for (const auto& record : records) {
        Aws::Kinesis::Model::PutRecordsRequestEntry entry;
        entry.SetPartitionKey(record.partition_key);
        entry.SetData(Aws::Utils::ByteBuffer(record.data.data(), record.data.size()));
        request.AddRecords(std::move(entry));
    }

    auto outcome = client_->PutRecords(request);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.calls++;
        stats_.last_call_timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        LOG(ERROR) << "PutRecords to " << stream_display_name(stream) << " failed: "
                   << error.GetExceptionName() << " (" << error.GetMessage() << ")";
        throw StreamTransportError(error.GetExceptionName(), error.GetMessage());
    }

    auto outcomes = to_record_outcomes(outcome.GetResult());
    if (outcomes.size() != records.size()) {
        LOG(ERROR) << "PutRecords returned " << outcomes.size()
                   << " results for " << records.size() << " records";
    }

    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t bytes = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].accepted) {
            rejected++;
            continue;
        }
        accepted++;
        if (i < records.size()) {
            bytes += records[i].data.size();
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.records_accepted += accepted;
        stats_.records_rejected += rejected;
        stats_.bytes_accepted += bytes;
    }

    VLOG(1) << "PutRecords to " << stream_display_name(stream) << ": "
            << accepted << " accepted, " << rejected << " rejected";
    return outcomes;
}

TransportStats KinesisStreamTransport::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace streamwriter
