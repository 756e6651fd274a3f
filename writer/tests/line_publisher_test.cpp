// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "fake_stream_transport.hpp"
#include "line_publisher.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace streamwriter::batching::test {

class LinePublisherTest : public ::testing::Test {
protected:
    Sleeper recording_sleeper() {
        return [this](std::chrono::milliseconds duration) { sleeps_.push_back(duration); };
    }

    BatchAccumulator make_writer(size_t max_records, size_t max_record_bytes = 1024 * 1024) {
        BatchLimits limits;
        limits.max_records_per_batch = max_records;
        limits.max_record_bytes = max_record_bytes;
        return BatchAccumulator(transport_, "example", limits, false,
                                [] { return std::string("key"); });
    }

    FakeStreamTransport transport_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(LinePublisherTest, FullBatchesSentWhileReading) {
    auto writer = make_writer(2);
    std::istringstream in("a\nb\nc\nd\ne\n");

    auto result = publish_lines(in, writer, {}, recording_sleeper());

    EXPECT_EQ(result.lines, 5u);
    EXPECT_EQ(result.enqueued, 5u);
    EXPECT_EQ(result.flushes, 2u);
    ASSERT_EQ(transport_.calls().size(), 2u);
    EXPECT_EQ(data_of(transport_.calls()[0].records), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(data_of(transport_.calls()[1].records), (std::vector<std::string>{"c", "d"}));

    // Leftover waits for drain(); accepted batches never sleep
    ASSERT_EQ(writer.size(), 1u);
    EXPECT_EQ(data_of(writer.pending()[0]), "e");
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(LinePublisherTest, BacksOffWhileStreamRejects) {
    transport_.set_handler([](const StreamRecord&, size_t, size_t) { return throttle_record(); });
    auto writer = make_writer(2);
    std::istringstream in("1\n2\n3\n4\n5\n6\n");

    PublishOptions options;
    options.backoff = std::chrono::milliseconds(300);
    auto result = publish_lines(in, writer, options, recording_sleeper());

    // The queue stays full, so every later line triggers a resend of the
    // rejected head; each one must be followed by a sleep
    EXPECT_EQ(result.flushes, 5u);
    EXPECT_EQ(transport_.calls().size(), 5u);
    ASSERT_EQ(sleeps_.size(), transport_.calls().size());
    for (const auto& duration : sleeps_) {
        EXPECT_EQ(duration, std::chrono::milliseconds(300));
    }
    EXPECT_EQ(writer.size(), 6u);
    EXPECT_EQ(data_of(writer.pending()[0]), "1");
}

TEST_F(LinePublisherTest, PartialRejectionBacksOff) {
    transport_.set_handler([](const StreamRecord&, size_t index, size_t call) {
        return (call == 0 && index == 1) ? throttle_record() : accept_record();
    });
    auto writer = make_writer(2);
    std::istringstream in("a\nb\n");

    auto result = publish_lines(in, writer, {}, recording_sleeper());

    EXPECT_EQ(result.flushes, 1u);
    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(2000));
    ASSERT_EQ(writer.size(), 1u);
    EXPECT_EQ(data_of(writer.pending()[0]), "b");
}

TEST_F(LinePublisherTest, JsonLinesSentCompact) {
    auto writer = make_writer(500);
    std::istringstream in("{ \"b\": 2, \"a\": 1 }\nnot json\n\n[1, 2]\n");

    PublishOptions options;
    options.json = true;
    auto result = publish_lines(in, writer, options, recording_sleeper());

    EXPECT_EQ(result.lines, 3u);
    EXPECT_EQ(result.enqueued, 2u);
    EXPECT_EQ(result.skipped, 1u);
    ASSERT_EQ(writer.size(), 2u);
    EXPECT_EQ(data_of(writer.pending()[0]), "{\"a\":1,\"b\":2}");
    EXPECT_EQ(data_of(writer.pending()[1]), "[1,2]");
}

TEST_F(LinePublisherTest, OversizeLineSkipped) {
    auto writer = make_writer(500, 16);
    std::istringstream in("short\nthis line is far too long\nok\n");

    auto result = publish_lines(in, writer, {}, recording_sleeper());

    EXPECT_EQ(result.enqueued, 2u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(writer.stats().records_refused, 1u);
    ASSERT_EQ(writer.size(), 2u);
    EXPECT_EQ(data_of(writer.pending()[1]), "ok");
}

TEST_F(LinePublisherTest, FixedPartitionKey) {
    auto writer = make_writer(500);
    std::istringstream in("a\nb\n");

    PublishOptions options;
    options.partition_key = std::string("argle");
    publish_lines(in, writer, options, recording_sleeper());

    ASSERT_EQ(writer.size(), 2u);
    EXPECT_EQ(writer.pending()[0].partition_key, "argle");
    EXPECT_EQ(writer.pending()[1].partition_key, "argle");
}

TEST_F(LinePublisherTest, StopsReadingWhenRequested) {
    auto writer = make_writer(500);
    std::istringstream in("a\nb\nc\nd\n");

    PublishOptions options;
    options.should_stop = [&writer] { return writer.size() >= 2; };
    auto result = publish_lines(in, writer, options, recording_sleeper());

    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.lines, 2u);
    EXPECT_EQ(writer.size(), 2u);
    EXPECT_TRUE(transport_.calls().empty());
}

TEST_F(LinePublisherTest, TransportFailurePropagates) {
    auto writer = make_writer(2);
    transport_.fail_next_call("AccessDeniedException", "not authorized");
    std::istringstream in("a\nb\nc\n");

    EXPECT_THROW(publish_lines(in, writer, {}, recording_sleeper()), StreamTransportError);
    EXPECT_EQ(writer.in_flight(), 2u);
    EXPECT_TRUE(writer.empty());
}

}  // namespace streamwriter::batching::test
