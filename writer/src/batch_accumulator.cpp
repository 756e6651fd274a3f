// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "batch_accumulator.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace streamwriter::batching {

namespace {

std::string format_messages(const std::set<std::string>& messages) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& message : messages) {
        if (!first) {
            oss << ", ";
        }
        oss << message;
        first = false;
    }
    oss << "}";
    return oss.str();
}

}  // namespace

BatchAccumulator::BatchAccumulator(StreamTransport& transport,
                                   std::string stream,
                                   const BatchLimits& limits,
                                   bool log_batches,
                                   PartitionKeyGenerator key_generator)
    : transport_(transport)
    , stream_(std::move(stream))
    , stream_name_(stream_display_name(stream_))
    , limits_(limits)
    , log_batches_(log_batches)
    , key_generator_(std::move(key_generator)) {
    const char* error = nullptr;
    if (!validate(limits_, &error)) {
        throw std::invalid_argument(std::string("invalid batch limits: ") + error);
    }
    if (!key_generator_) {
        throw std::invalid_argument("partition key generator must not be empty");
    }
}

void BatchAccumulator::enqueue(const Payload& payload,
                               std::optional<std::string> partition_key) {
    StreamRecord record;
    if (partition_key && !partition_key->empty()) {
        record.partition_key = std::move(*partition_key);
    } else {
        record.partition_key = key_generator_();
    }

    if (record.partition_key.size() > limits_.max_partition_key_bytes) {
        stats_.records_refused++;
        throw PartitionKeyTooLargeError(record.partition_key.size(),
                                        limits_.max_partition_key_bytes);
    }

    record.data = payload.encode();

    size_t record_size = encoded_size(record);
    if (record_size > limits_.max_record_bytes) {
        stats_.records_refused++;
        throw RecordTooLargeError(record_size, record.data.size(),
                                  record.partition_key.size(), limits_.max_record_bytes);
    }

    queue_.push_back(std::move(record));
    queued_bytes_ += record_size;
    stats_.records_enqueued++;
}

bool BatchAccumulator::flush() {
    if (queue_.empty()) {
        return false;
    }

    std::vector<StreamRecord> batch = take_batch();

    if (log_batches_) {
        LOG(INFO) << "sending " << batch.size() << " messages to stream " << stream_name_;
    }

    stats_.batches_submitted++;
    in_flight_ = batch.size();
    auto outcomes = transport_.put_records(stream_, batch);
    in_flight_ = 0;

    process_outcomes(batch, outcomes);

    if (log_batches_) {
        LOG(INFO) << "sent " << last_batch_.size << " messages to stream " << stream_name_
                  << "; " << last_batch_.success_count << " successful"
                  << "; errors = " << format_messages(last_batch_.failure_messages);
    }

    return !queue_.empty();
}

std::vector<StreamRecord> BatchAccumulator::take_batch() {
    size_t count = 0;
    size_t bytes = 0;
    while (count < queue_.size() && count < limits_.max_records_per_batch) {
        size_t record_size = encoded_size(queue_[count]);
        if (bytes + record_size > limits_.max_bytes_per_batch) {
            break;
        }
        bytes += record_size;
        ++count;
    }

    std::vector<StreamRecord> batch;
    batch.reserve(count);
    auto end = queue_.begin() + static_cast<std::ptrdiff_t>(count);
    std::move(queue_.begin(), end, std::back_inserter(batch));
    queue_.erase(queue_.begin(), end);
    queued_bytes_ -= bytes;

    return batch;
}

void BatchAccumulator::process_outcomes(std::vector<StreamRecord>& batch,
                                        const std::vector<RecordOutcome>& outcomes) {
    if (outcomes.size() != batch.size()) {
        LOG(ERROR) << "Transport " << transport_.name() << " returned " << outcomes.size()
                   << " outcomes for " << batch.size() << " records to " << stream_name_
                   << "; records without an outcome will be retried";
    }

    last_batch_ = LastBatch{};
    last_batch_.size = batch.size();

    std::vector<StreamRecord> rejected;
    size_t rejected_bytes = 0;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (i < outcomes.size() && outcomes[i].accepted) {
            last_batch_.success_count++;
            stats_.records_accepted++;
            stats_.bytes_accepted += encoded_size(batch[i]);
            continue;
        }

        if (i < outcomes.size()) {
            const auto& outcome = outcomes[i];
            last_batch_.failure_messages.insert(
                outcome.error_message.empty() ? outcome.error_code : outcome.error_message);
        } else {
            last_batch_.failure_messages.insert("no result returned for record");
        }

        rejected_bytes += encoded_size(batch[i]);
        rejected.push_back(std::move(batch[i]));
    }

    // Rejected records go back to the head, ahead of leftovers and newer records
    queue_.insert(queue_.begin(),
                  std::make_move_iterator(rejected.begin()),
                  std::make_move_iterator(rejected.end()));
    queued_bytes_ += rejected_bytes;
    stats_.records_requeued += rejected.size();

    VLOG(1) << "Batch to " << stream_name_ << ": " << last_batch_.success_count << "/"
            << last_batch_.size << " accepted, " << queue_.size() << " queued";
}

}  // namespace streamwriter::batching
