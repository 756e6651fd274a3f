// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "line_publisher.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace streamwriter::batching {

namespace {

bool batch_full(const BatchAccumulator& accumulator) {
    const auto& limits = accumulator.limits();
    return accumulator.size() >= limits.max_records_per_batch ||
           accumulator.queued_bytes() >= limits.max_bytes_per_batch;
}

}  // namespace

PublishResult publish_lines(std::istream& in,
                            BatchAccumulator& accumulator,
                            const PublishOptions& options,
                            const Sleeper& sleep) {
    PublishResult result;
    size_t line_number = 0;
    std::string line;

    while (true) {
        if (options.should_stop && options.should_stop()) {
            result.stopped = true;
            LOG(INFO) << "Input stopped after " << line_number << " lines";
            break;
        }
        if (!std::getline(in, line)) {
            break;
        }

        ++line_number;
        if (line.empty()) {
            continue;
        }
        ++result.lines;

        try {
            if (options.json) {
                accumulator.enqueue(Payload::structured(nlohmann::json::parse(line)),
                                    options.partition_key);
            } else {
                accumulator.enqueue(Payload::text(line), options.partition_key);
            }
        } catch (const nlohmann::json::exception& e) {
            LOG(ERROR) << "Line " << line_number << ": invalid JSON: " << e.what();
            ++result.skipped;
            continue;
        } catch (const RecordRejectedError& e) {
            LOG(ERROR) << "Line " << line_number << ": " << e.what();
            ++result.skipped;
            continue;
        }
        ++result.enqueued;

        if (!batch_full(accumulator)) {
            continue;
        }

        ++result.flushes;
        accumulator.flush();

        const auto& last = accumulator.last_batch();
        if (last.success_count < last.size && options.backoff.count() > 0 && sleep) {
            VLOG(1) << (last.size - last.success_count) << " records rejected at line "
                    << line_number << ", sleeping " << options.backoff.count() << "ms";
            sleep(options.backoff);
        }
    }

    return result;
}

}  // namespace streamwriter::batching
