// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file fake_stream_transport.hpp
 * @brief Scriptable in-memory transport that records every submitted batch
 */

#pragma once

#include "streamwriter/stream_transport.hpp"

#include <functional>
#include <string>
#include <vector>

namespace streamwriter::batching::test {

constexpr const char* THROTTLING_CODE = "ProvisionedThroughputExceededException";
constexpr const char* THROTTLING_MESSAGE = "Rate exceeded";

/// Decides the outcome of one record: (record, index in batch, call number)
using OutcomeHandler =
    std::function<RecordOutcome(const StreamRecord&, size_t index, size_t call)>;

inline RecordOutcome accept_record() {
    return RecordOutcome::success("shardId-000000000000", "49546986683135544286507457936321625675700192471156785154");
}

inline RecordOutcome throttle_record() {
    return RecordOutcome::failure(THROTTLING_CODE, THROTTLING_MESSAGE);
}

class FakeStreamTransport : public StreamTransport {
public:
    struct Call {
        std::string stream;
        std::vector<StreamRecord> records;
    };

    FakeStreamTransport() = default;
    explicit FakeStreamTransport(OutcomeHandler handler) : handler_(std::move(handler)) {}

    void set_handler(OutcomeHandler handler) { handler_ = std::move(handler); }

    /// Throw this error from the next put_records() call
    void fail_next_call(const std::string& code, const std::string& message) {
        fail_code_ = code;
        fail_message_ = message;
        fail_next_ = true;
    }

    std::vector<RecordOutcome> put_records(
        const std::string& stream,
        const std::vector<StreamRecord>& records) override {
        calls_.push_back(Call{stream, records});
        stats_.calls++;

        if (fail_next_) {
            fail_next_ = false;
            throw StreamTransportError(fail_code_, fail_message_);
        }

        std::vector<RecordOutcome> outcomes;
        for (size_t i = 0; i < records.size(); ++i) {
            auto outcome = handler_ ? handler_(records[i], i, calls_.size() - 1) : accept_record();
            if (outcome.accepted) {
                stats_.records_accepted++;
                stats_.bytes_accepted += records[i].data.size();
            } else {
                stats_.records_rejected++;
            }
            outcomes.push_back(std::move(outcome));
        }

        if (truncate_outcomes_ > 0 && outcomes.size() >= truncate_outcomes_) {
            outcomes.resize(outcomes.size() - truncate_outcomes_);
        }
        return outcomes;
    }

    /// Drop the last @p count outcomes from every response
    void truncate_outcomes(size_t count) { truncate_outcomes_ = count; }

    TransportStats stats() const override { return stats_; }
    std::string name() const override { return "fake"; }

    const std::vector<Call>& calls() const { return calls_; }
    void reset_calls() { calls_.clear(); }

private:
    OutcomeHandler handler_;
    std::vector<Call> calls_;
    TransportStats stats_;

    bool fail_next_ = false;
    std::string fail_code_;
    std::string fail_message_;
    size_t truncate_outcomes_ = 0;
};

/// Data of a record as text
inline std::string data_of(const StreamRecord& record) {
    return std::string(record.data.begin(), record.data.end());
}

/// Data of every record in a batch as text
inline std::vector<std::string> data_of(const std::vector<StreamRecord>& records) {
    std::vector<std::string> result;
    for (const auto& record : records) {
        result.push_back(data_of(record));
    }
    return result;
}

}  // namespace streamwriter::batching::test
