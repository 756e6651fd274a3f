// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "drain.hpp"
#include "fake_stream_transport.hpp"

#include <gtest/gtest.h>

namespace streamwriter::batching::test {

class DrainTest : public ::testing::Test {
protected:
    Sleeper recording_sleeper() {
        return [this](std::chrono::milliseconds duration) { sleeps_.push_back(duration); };
    }

    BatchAccumulator make_writer(size_t max_records = 500) {
        BatchLimits limits;
        limits.max_records_per_batch = max_records;
        return BatchAccumulator(transport_, "example", limits, false,
                                [] { return std::string("key"); });
    }

    FakeStreamTransport transport_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(DrainTest, EmptyQueueIsAlreadyDrained) {
    auto writer = make_writer();

    auto result = drain(writer, {}, recording_sleeper());

    EXPECT_TRUE(result.drained);
    EXPECT_EQ(result.flushes, 0u);
    EXPECT_TRUE(transport_.calls().empty());
}

TEST_F(DrainTest, LeftoversAreSentWithoutSleeping) {
    auto writer = make_writer(2);
    for (int i = 0; i < 5; ++i) {
        writer.enqueue(Payload::text("m" + std::to_string(i)));
    }

    auto result = drain(writer, {}, recording_sleeper());

    EXPECT_TRUE(result.drained);
    EXPECT_EQ(result.flushes, 3u);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_TRUE(writer.empty());
}

TEST_F(DrainTest, SleepsAfterRejections) {
    transport_.set_handler([](const StreamRecord&, size_t index, size_t call) {
        return (call < 2 && index == 0) ? throttle_record() : accept_record();
    });
    auto writer = make_writer();
    writer.enqueue(Payload::text("a"));
    writer.enqueue(Payload::text("b"));

    DrainOptions options;
    options.interval = std::chrono::milliseconds(250);
    auto result = drain(writer, options, recording_sleeper());

    EXPECT_TRUE(result.drained);
    EXPECT_EQ(result.flushes, 3u);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(250));
    EXPECT_EQ(sleeps_[1], std::chrono::milliseconds(250));
}

TEST_F(DrainTest, GivesUpAfterMaxFlushes) {
    transport_.set_handler([](const StreamRecord&, size_t, size_t) { return throttle_record(); });
    auto writer = make_writer();
    writer.enqueue(Payload::text("a"));
    writer.enqueue(Payload::text("b"));

    DrainOptions options;
    options.max_flushes = 4;
    auto result = drain(writer, options, recording_sleeper());

    EXPECT_FALSE(result.drained);
    EXPECT_EQ(result.flushes, 4u);
    EXPECT_EQ(transport_.calls().size(), 4u);
    EXPECT_EQ(writer.size(), 2u) << "nothing is dropped when giving up";
}

TEST_F(DrainTest, StopsWhenRequested) {
    transport_.set_handler([](const StreamRecord&, size_t, size_t) { return throttle_record(); });
    auto writer = make_writer();
    writer.enqueue(Payload::text("a"));

    // Unlimited flushes; only the stop request ends the loop
    bool stop = false;
    DrainOptions options;
    options.should_stop = [&stop] { return stop; };
    Sleeper sleeper = [this, &stop](std::chrono::milliseconds duration) {
        sleeps_.push_back(duration);
        if (sleeps_.size() == 3) {
            stop = true;
        }
    };

    auto result = drain(writer, options, sleeper);

    EXPECT_FALSE(result.drained);
    EXPECT_EQ(result.flushes, 3u);
    EXPECT_EQ(transport_.calls().size(), 3u);
    EXPECT_EQ(writer.size(), 1u);
}

TEST_F(DrainTest, StopBeforeFirstFlushSendsNothing) {
    auto writer = make_writer();
    writer.enqueue(Payload::text("a"));

    DrainOptions options;
    options.should_stop = [] { return true; };
    auto result = drain(writer, options, recording_sleeper());

    EXPECT_FALSE(result.drained);
    EXPECT_EQ(result.flushes, 0u);
    EXPECT_TRUE(transport_.calls().empty());
}

TEST_F(DrainTest, ZeroIntervalNeverSleeps) {
    transport_.set_handler([](const StreamRecord&, size_t, size_t call) {
        return call == 0 ? throttle_record() : accept_record();
    });
    auto writer = make_writer();
    writer.enqueue(Payload::text("a"));

    DrainOptions options;
    options.interval = std::chrono::milliseconds(0);
    auto result = drain(writer, options, recording_sleeper());

    EXPECT_TRUE(result.drained);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(DrainTest, TransportFailurePropagates) {
    auto writer = make_writer();
    writer.enqueue(Payload::text("a"));
    transport_.fail_next_call("AccessDeniedException", "not authorized");

    EXPECT_THROW(drain(writer, {}, recording_sleeper()), StreamTransportError);
    EXPECT_TRUE(writer.empty());
}

}  // namespace streamwriter::batching::test
