// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "drain.hpp"

#include <glog/logging.h>

#include <thread>

namespace streamwriter::batching {

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

DrainResult drain(BatchAccumulator& accumulator,
                  const DrainOptions& options,
                  const Sleeper& sleep) {
    DrainResult result;

    while (!accumulator.empty()) {
        if (options.should_stop && options.should_stop()) {
            LOG(WARNING) << "Stopped after " << result.flushes << " flushes with "
                         << accumulator.size() << " records queued for "
                         << accumulator.stream_name();
            return result;
        }

        if (options.max_flushes > 0 && result.flushes >= options.max_flushes) {
            LOG(WARNING) << "Giving up after " << result.flushes << " flushes with "
                         << accumulator.size() << " records queued for "
                         << accumulator.stream_name();
            return result;
        }

        ++result.flushes;
        if (!accumulator.flush()) {
            break;
        }

        const auto& last = accumulator.last_batch();
        if (last.success_count < last.size) {
            // Rejections usually mean throttling; back off before retrying
            VLOG(1) << (last.size - last.success_count) << " records rejected, sleeping "
                    << options.interval.count() << "ms";
            if (sleep && options.interval.count() > 0) {
                sleep(options.interval);
            }
        }
    }

    result.drained = true;
    return result;
}

}  // namespace streamwriter::batching
