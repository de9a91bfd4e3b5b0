#include <gtest/gtest.h>

#include <vector>

#include "TestSupport.hpp"
#include "loglens/core/Errors.hpp"
#include "loglens/window/SlidingWindow.hpp"
#include "loglens/window/TumblingWindow.hpp"

using namespace LogLens;
using namespace LogLens::Window;
using Testing::atMinutes;
using Testing::atSeconds;

class WindowTest : public ::testing::Test {
protected:
    WindowSpec sliding5m = WindowSpec::parse("5m", "sliding");
    WindowSpec tumbling5m = WindowSpec::parse("5m", "tumbling");
};

TEST_F(WindowTest, SpecParsingRejectsBadInput) {
    EXPECT_EQ(sliding5m.strategy, WindowStrategy::Sliding);
    EXPECT_EQ(tumbling5m.strategy, WindowStrategy::Tumbling);
    EXPECT_DOUBLE_EQ(sliding5m.seconds(), 300.0);

    EXPECT_THROW(WindowSpec::parse("0s"), Core::ConfigurationError);
    EXPECT_THROW(WindowSpec::parse("five minutes"), Core::ConfigurationError);
    EXPECT_THROW(WindowSpec::parse("5m", "hopping"), Core::ConfigurationError);
}

TEST_F(WindowTest, FactoryBuildsRequestedStrategy) {
    auto s = makeWindow(sliding5m);
    auto t = makeWindow(tumbling5m);
    EXPECT_NE(dynamic_cast<SlidingWindow *>(s.get()), nullptr);
    EXPECT_NE(dynamic_cast<TumblingWindow *>(t.get()), nullptr);
}

TEST_F(WindowTest, SlidingEmitsOnEveryAdmission) {
    SlidingWindow window(sliding5m);
    for (int i = 0; i < 3; ++i) {
        auto frame = window.admit(1.0, atMinutes(i));
        ASSERT_TRUE(frame.has_value());
        EXPECT_EQ(frame->values.size(), static_cast<std::size_t>(i + 1));
        EXPECT_EQ(frame->end, atMinutes(i));
    }
}

TEST_F(WindowTest, SlidingEvictsStrictlyOlderEntries) {
    SlidingWindow window(sliding5m);
    window.admit(1.0, atMinutes(0));
    window.admit(2.0, atMinutes(1));

    // Entry at t=0 sits exactly on the bound and stays.
    auto frame = window.admit(3.0, atMinutes(5));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->values, (std::vector<double>{1.0, 2.0, 3.0}));

    frame = window.admit(4.0, atSeconds(5 * 60 + 1));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->values, (std::vector<double>{2.0, 3.0, 4.0}));
}

TEST_F(WindowTest, SlidingBoundHoldsForEveryAdmission) {
    SlidingWindow window(WindowSpec::parse("30s"));
    const std::vector<long long> offsets{0, 3, 7, 20, 31, 33, 60, 61, 62, 95, 200, 201, 229, 231};
    for (long long s : offsets) {
        auto frame = window.admit(static_cast<double>(s), atSeconds(s));
        ASSERT_TRUE(frame.has_value());
        for (double v : frame->values) {
            EXPECT_GE(static_cast<long long>(v), s - 30) << "after admitting t=" << s;
        }
    }
}

TEST_F(WindowTest, SlidingElapsedIsSpanOfRetainedEntries) {
    SlidingWindow window(sliding5m);
    auto single = window.admit(1.0, atSeconds(10));
    ASSERT_TRUE(single.has_value());
    EXPECT_DOUBLE_EQ(single->elapsedSeconds, 0.0);

    auto frame = window.admit(1.0, atSeconds(40));
    ASSERT_TRUE(frame.has_value());
    EXPECT_DOUBLE_EQ(frame->elapsedSeconds, 30.0);
}

TEST_F(WindowTest, SlidingDropsEventsBelowLowerBound) {
    SlidingWindow window(sliding5m);
    window.admit(1.0, atMinutes(10));

    auto frame = window.admit(99.0, atMinutes(4));
    EXPECT_FALSE(frame.has_value());
    EXPECT_EQ(window.lateDrops(), 1u);
    EXPECT_EQ(window.size(), 1u);
    EXPECT_EQ(window.end(), atMinutes(10));
}

TEST_F(WindowTest, SlidingInsertsLateEventInsideBoundInOrder) {
    SlidingWindow window(sliding5m);
    window.admit(1.0, atMinutes(6));
    window.admit(3.0, atMinutes(10));

    auto frame = window.admit(2.0, atMinutes(8));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->values, (std::vector<double>{1.0, 2.0, 3.0}));
    EXPECT_EQ(frame->end, atMinutes(10));
    EXPECT_EQ(window.lateDrops(), 0u);
}

TEST_F(WindowTest, SlidingFlushHasNothingPending) {
    SlidingWindow window(sliding5m);
    window.admit(1.0, atMinutes(0));
    EXPECT_FALSE(window.flush().has_value());
}

TEST_F(WindowTest, TumblingAlignsToEpochMultiples) {
    const auto aligned = TumblingWindow::alignDown(atSeconds(7 * 60 + 13), std::chrono::minutes(5));
    EXPECT_EQ(aligned, atMinutes(5));

    TumblingWindow window(tumbling5m);
    EXPECT_FALSE(window.admit(1.0, atSeconds(7 * 60 + 13)).has_value());
    EXPECT_EQ(window.start(), atMinutes(5));
    EXPECT_EQ(window.end(), atMinutes(10));
}

TEST_F(WindowTest, TumblingEmitsWhenWindowCloses) {
    TumblingWindow window(tumbling5m);
    EXPECT_FALSE(window.admit(1.0, atMinutes(0)).has_value());
    EXPECT_FALSE(window.admit(2.0, atMinutes(4)).has_value());

    auto frame = window.admit(3.0, atMinutes(5));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->start, atMinutes(0));
    EXPECT_EQ(frame->end, atMinutes(5));
    EXPECT_EQ(frame->values, (std::vector<double>{1.0, 2.0}));
    EXPECT_DOUBLE_EQ(frame->elapsedSeconds, 300.0);
    EXPECT_EQ(window.size(), 1u);
}

TEST_F(WindowTest, TumblingWindowsPartitionTime) {
    TumblingWindow window(tumbling5m);
    std::vector<WindowFrame> frames;
    for (long long m : {0, 1, 6, 7, 12, 31, 33, 36, 40}) {
        if (auto frame = window.admit(1.0, atMinutes(m))) {
            frames.push_back(*frame);
        }
    }
    if (auto last = window.flush()) {
        frames.push_back(*last);
    }

    ASSERT_GE(frames.size(), 2u);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i].end - frames[i].start, tumbling5m.duration);
        if (i > 0) {
            EXPECT_GE(frames[i].start, frames[i - 1].end) << "windows overlap at " << i;
        }
    }
}

TEST_F(WindowTest, TumblingSkipsEmptyWindowsWithOneEmission) {
    TumblingWindow window(tumbling5m);
    window.admit(1.0, atMinutes(1));

    auto frame = window.admit(2.0, atMinutes(23));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->start, atMinutes(0));
    EXPECT_EQ(window.start(), atMinutes(20));
    EXPECT_EQ(window.end(), atMinutes(25));
}

TEST_F(WindowTest, TumblingDropsEventsBeforeCurrentWindow) {
    TumblingWindow window(tumbling5m);
    window.admit(1.0, atMinutes(11));

    EXPECT_FALSE(window.admit(5.0, atMinutes(9)).has_value());
    EXPECT_EQ(window.lateDrops(), 1u);
    EXPECT_EQ(window.size(), 1u);

    // Late within the current window is still accepted.
    window.admit(2.0, atSeconds(10 * 60 + 30));
    EXPECT_EQ(window.size(), 2u);
}

TEST_F(WindowTest, TumblingFlushEmitsPartialWindowAndAdvances) {
    TumblingWindow window(tumbling5m);
    EXPECT_FALSE(window.flush().has_value());

    window.admit(1.0, atMinutes(2));
    window.admit(2.0, atMinutes(3));
    auto frame = window.flush();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->values.size(), 2u);
    EXPECT_EQ(frame->start, atMinutes(0));
    EXPECT_EQ(frame->end, atMinutes(5));
    EXPECT_EQ(window.size(), 0u);
    EXPECT_EQ(window.start(), atMinutes(5));
    EXPECT_FALSE(window.flush().has_value());
}

TEST_F(WindowTest, TumblingFlushedSpanIsNeverEmittedTwice) {
    TumblingWindow window(tumbling5m);
    window.admit(1.0, atMinutes(1));
    ASSERT_TRUE(window.flush().has_value());

    // Still inside the flushed span: late.
    EXPECT_FALSE(window.admit(2.0, atMinutes(4)).has_value());
    EXPECT_EQ(window.lateDrops(), 1u);
    EXPECT_EQ(window.size(), 0u);

    window.admit(3.0, atMinutes(6));
    auto next = window.admit(4.0, atMinutes(11));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->start, atMinutes(5));
    ASSERT_EQ(next->values.size(), 1u);
    EXPECT_DOUBLE_EQ(next->values[0], 3.0);
}

TEST_F(WindowTest, ResetReturnsToFreshState) {
    TumblingWindow window(tumbling5m);
    window.admit(1.0, atMinutes(11));
    window.admit(1.0, atMinutes(2));
    window.reset();

    EXPECT_EQ(window.size(), 0u);
    EXPECT_EQ(window.lateDrops(), 0u);
    EXPECT_FALSE(window.lowerBound().has_value());

    // A fresh window accepts any first timestamp again.
    window.admit(1.0, atMinutes(2));
    EXPECT_EQ(window.start(), atMinutes(0));
}
