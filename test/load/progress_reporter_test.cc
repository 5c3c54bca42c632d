#include <gtest/gtest.h>
#include "../../src/load/progress_reporter.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace KvLoad;
using namespace std::chrono_literals;

TEST(ProgressReporterTest, ReportsPeriodicallyAndOnStop) {
    std::atomic<int> calls{0};
    ProgressReporter reporter("test", 100, 5ms,
            [&]() { calls.fetch_add(1); return int64_t{42}; },
            []() { return std::string("detail"); });
    reporter.Start();
    std::this_thread::sleep_for(60ms);
    reporter.Stop();

    // At least one periodic report plus the final one.
    EXPECT_GE(calls.load(), 2);

    int after_stop = calls.load();
    reporter.Stop();
    EXPECT_EQ(calls.load(), after_stop);
}

TEST(ProgressReporterTest, ZeroIntervalOnlyReportsFinalState) {
    std::atomic<int> calls{0};
    ProgressReporter reporter("quiet", 10, 0ms,
            [&]() { calls.fetch_add(1); return int64_t{10}; },
            []() { return std::string(); });
    reporter.Start();
    std::this_thread::sleep_for(10ms);
    EXPECT_EQ(calls.load(), 0);
    reporter.Stop();
    EXPECT_EQ(calls.load(), 1);
}

TEST(ProgressReporterTest, NeverStartedReportsNothing) {
    std::atomic<int> calls{0};
    {
        ProgressReporter reporter("idle", 10, 1ms,
                [&]() { calls.fetch_add(1); return int64_t{0}; },
                []() { return std::string(); });
    }
    EXPECT_EQ(calls.load(), 0);
}
