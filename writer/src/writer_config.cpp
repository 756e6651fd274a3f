// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "writer_config.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace streamwriter::batching {

std::optional<WriterConfig> parse_writer_config(const YAML::Node& root,
                                                const WriterConfig& base) {
    WriterConfig config = base;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        LOG(ERROR) << "Writer configuration must be a YAML map";
        return std::nullopt;
    }

    try {
        if (root["stream"]) config.stream = root["stream"].as<std::string>();
        if (root["log_batches"]) config.log_batches = root["log_batches"].as<bool>();

        if (root["batching"]) {
            auto batching = root["batching"];
            if (batching["max_records"]) {
                config.limits.max_records_per_batch = batching["max_records"].as<size_t>();
            }
            if (batching["max_bytes"]) {
                config.limits.max_bytes_per_batch = batching["max_bytes"].as<size_t>();
            }
            if (batching["max_record_bytes"]) {
                config.limits.max_record_bytes = batching["max_record_bytes"].as<size_t>();
            }
            if (batching["max_partition_key_bytes"]) {
                config.limits.max_partition_key_bytes =
                    batching["max_partition_key_bytes"].as<size_t>();
            }
            if (batching["record_overhead_bytes"]) {
                config.limits.record_overhead_bytes =
                    batching["record_overhead_bytes"].as<size_t>();
            }
        }

        if (root["drain"]) {
            auto drain = root["drain"];
            if (drain["interval_ms"]) {
                config.drain.interval = std::chrono::milliseconds(drain["interval_ms"].as<long>());
            }
            if (drain["max_flushes"]) config.drain.max_flushes = drain["max_flushes"].as<size_t>();
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Invalid writer configuration: " << e.what();
        return std::nullopt;
    }

    const char* error = nullptr;
    if (!validate(config.limits, &error)) {
        LOG(ERROR) << "Invalid batching configuration: " << error;
        return std::nullopt;
    }
    if (config.drain.interval.count() < 0) {
        LOG(ERROR) << "Invalid drain configuration: interval_ms must not be negative";
        return std::nullopt;
    }

    return config;
}

std::optional<WriterConfig> load_writer_config(const std::string& path,
                                               const WriterConfig& base) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to load config file " << path << ": " << e.what();
        return std::nullopt;
    }

    auto config = parse_writer_config(root, base);
    if (config) {
        LOG(INFO) << "Loaded configuration from " << path;
    }
    return config;
}

}  // namespace streamwriter::batching
