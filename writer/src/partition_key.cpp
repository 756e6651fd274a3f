// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "partition_key.hpp"

#include <iomanip>
#include <sstream>

namespace streamwriter::batching {

std::string epoch_seconds_key(std::chrono::system_clock::time_point when) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        when.time_since_epoch()).count();

    std::ostringstream oss;
    oss << (micros / 1000000) << "."
        << std::setw(6) << std::setfill('0') << (micros % 1000000);
    return oss.str();
}

PartitionKeyGenerator system_clock_key_generator() {
    return [] { return epoch_seconds_key(std::chrono::system_clock::now()); };
}

}  // namespace streamwriter::batching
