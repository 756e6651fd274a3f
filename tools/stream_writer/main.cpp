// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief Stream Writer - publishes newline-delimited messages to a Kinesis stream
///
/// Each input line becomes one record. Records are sent in PutRecords-sized
/// batches; records the stream rejects (throttling) are retried until the
/// queue drains.
///
/// Usage:
///   stream_writer --stream=example < messages.txt
///   stream_writer --config=writer.yaml --input=events.jsonl --json
///   stream_writer --stream=example --dry_run --log_batches < messages.txt

#include "batch_accumulator.hpp"
#include "drain.hpp"
#include "line_publisher.hpp"
#include "writer_config.hpp"
#include "streamwriter/console_stream_transport.hpp"
#include "streamwriter/kinesis_stream_transport.hpp"

#include <aws/core/Aws.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>

// Command line flags (override the config file when given)
DEFINE_string(config, "", "YAML configuration file");
DEFINE_string(stream, "", "Stream name or ARN");
DEFINE_string(input, "", "Input file (default: stdin)");
DEFINE_string(partition_key, "", "Partition key for every record (default: current time)");
DEFINE_bool(json, false, "Parse each line as JSON and send its compact form");
DEFINE_bool(dry_run, false, "Print records to stdout instead of sending them");
DEFINE_bool(log_batches, false, "Log every batch sent");
DEFINE_string(region, "", "AWS region (default: SDK default chain)");
DEFINE_string(endpoint, "", "Endpoint override, e.g. http://localhost:4566");
DEFINE_int32(drain_interval_ms, 2000, "Delay after a batch with rejected records");
DEFINE_int32(max_flushes, 0, "Give up draining after this many flushes (0=unlimited)");

namespace {

namespace batching = streamwriter::batching;

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

bool flag_given(const char* name) {
    return !gflags::GetCommandLineFlagInfoOrDie(name).is_default;
}

struct Config {
    batching::WriterConfig writer;
    streamwriter::KinesisTransportConfig kinesis;
};

bool load_config(Config& config) {
    if (!FLAGS_config.empty()) {
        auto writer = batching::load_writer_config(FLAGS_config);
        if (!writer) {
            return false;
        }
        config.writer = *writer;

        try {
            YAML::Node yaml = YAML::LoadFile(FLAGS_config);
            if (yaml["kinesis"]) {
                auto kinesis = yaml["kinesis"];
                if (kinesis["region"]) config.kinesis.region = kinesis["region"].as<std::string>();
                if (kinesis["endpoint_override"]) {
                    config.kinesis.endpoint_override = kinesis["endpoint_override"].as<std::string>();
                }
                if (kinesis["request_timeout_ms"]) {
                    config.kinesis.request_timeout_ms = kinesis["request_timeout_ms"].as<long>();
                }
                if (kinesis["connect_timeout_ms"]) {
                    config.kinesis.connect_timeout_ms = kinesis["connect_timeout_ms"].as<long>();
                }
            }
        } catch (const YAML::Exception& e) {
            LOG(ERROR) << "Invalid kinesis configuration: " << e.what();
            return false;
        }
    }

    if (flag_given("stream")) config.writer.stream = FLAGS_stream;
    if (flag_given("log_batches")) config.writer.log_batches = FLAGS_log_batches;
    if (flag_given("region")) config.kinesis.region = FLAGS_region;
    if (flag_given("endpoint")) config.kinesis.endpoint_override = FLAGS_endpoint;
    if (flag_given("drain_interval_ms") || FLAGS_config.empty()) {
        config.writer.drain.interval = std::chrono::milliseconds(FLAGS_drain_interval_ms);
    }
    if (flag_given("max_flushes") || FLAGS_config.empty()) {
        config.writer.drain.max_flushes = static_cast<size_t>(std::max(0, FLAGS_max_flushes));
    }

    if (config.writer.stream.empty()) {
        LOG(ERROR) << "No stream given (use --stream or 'stream' in the config file)";
        return false;
    }
    return true;
}

void log_config(const Config& config) {
    const auto& limits = config.writer.limits;
    LOG(INFO) << "=== Stream Writer Configuration ===";
    LOG(INFO) << "Stream: " << config.writer.stream;
    LOG(INFO) << "Transport: " << (FLAGS_dry_run ? "console (dry run)" : "kinesis");
    if (!FLAGS_dry_run) {
        LOG(INFO) << "Region: " << (config.kinesis.region.empty() ? "(default)" : config.kinesis.region);
        if (!config.kinesis.endpoint_override.empty()) {
            LOG(INFO) << "Endpoint: " << config.kinesis.endpoint_override;
        }
    }
    LOG(INFO) << "Batching: " << limits.max_records_per_batch << " records, "
              << limits.max_bytes_per_batch << " bytes per batch, "
              << limits.max_record_bytes << " bytes per record";
    LOG(INFO) << "Drain: " << config.writer.drain.interval.count() << "ms interval, "
              << (config.writer.drain.max_flushes == 0
                      ? std::string("unlimited")
                      : std::to_string(config.writer.drain.max_flushes)) << " flushes";
}

int run(const Config& config, streamwriter::StreamTransport& transport) {
    batching::BatchAccumulator accumulator(
        transport, config.writer.stream, config.writer.limits, config.writer.log_batches);

    std::ifstream file;
    std::istream* in = &std::cin;
    if (!FLAGS_input.empty()) {
        file.open(FLAGS_input);
        if (!file.is_open()) {
            LOG(ERROR) << "Failed to open input file: " << FLAGS_input;
            return 1;
        }
        in = &file;
    }

    auto stop_requested = [] { return g_shutdown.load(); };

    batching::PublishOptions publish;
    if (!FLAGS_partition_key.empty()) {
        publish.partition_key = FLAGS_partition_key;
    }
    publish.json = FLAGS_json;
    publish.backoff = config.writer.drain.interval;
    publish.should_stop = stop_requested;

    batching::DrainOptions drain_options = config.writer.drain;
    drain_options.should_stop = stop_requested;

    batching::PublishResult published;
    batching::DrainResult result;
    try {
        published = batching::publish_lines(*in, accumulator, publish);
        result = batching::drain(accumulator, drain_options);
    } catch (const streamwriter::StreamTransportError& e) {
        LOG(ERROR) << "Transport failure: " << e.what() << "; " << accumulator.in_flight()
                   << " records in flight were lost, " << accumulator.size()
                   << " records still queued";
        return 2;
    }

    const auto& stats = accumulator.stats();
    LOG(INFO) << "Final stats: enqueued=" << stats.records_enqueued
              << " accepted=" << stats.records_accepted
              << " retried=" << stats.records_requeued
              << " skipped=" << published.skipped
              << " batches=" << stats.batches_submitted
              << " bytes=" << stats.bytes_accepted;

    if (!result.drained) {
        LOG(ERROR) << accumulator.size() << " records not sent after "
                   << result.flushes << " flushes";
        return 2;
    }
    return published.skipped > 0 ? 1 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Initialize logging and flags
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Stream Writer - publishes newline-delimited messages to a stream");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Config config;
    if (!load_config(config)) {
        return 1;
    }
    log_config(config);

    if (FLAGS_dry_run) {
        streamwriter::ConsoleStreamTransport transport(std::cout);
        return run(config, transport);
    }

    Aws::SDKOptions options;
    Aws::InitAPI(options);
    int rc = 0;
    {
        streamwriter::KinesisStreamTransport transport(config.kinesis);
        rc = run(config, transport);
    }
    Aws::ShutdownAPI(options);
    return rc;
}
