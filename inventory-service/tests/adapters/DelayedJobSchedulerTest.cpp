/**
 * @file DelayedJobSchedulerTest.cpp
 * @brief Unit tests for DelayedJobScheduler
 */

#include <gtest/gtest.h>
#include "adapters/secondary/scheduler/DelayedJobScheduler.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace inventory;
using namespace inventory::adapters::secondary;
using domain::Timestamp;
using namespace std::chrono_literals;

class DelayedJobSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_ = std::make_unique<DelayedJobScheduler>(settings::SchedulerSettings(2, 3, 20ms));
    }

    void TearDown() override {
        scheduler_->stop();
    }

    static Timestamp in(std::chrono::milliseconds delay) {
        return Timestamp::now().plus(delay);
    }

    static bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 3000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return condition();
    }

    std::unique_ptr<DelayedJobScheduler> scheduler_;
};

TEST_F(DelayedJobSchedulerTest, RunsJobAtScheduledTime) {
    std::atomic<int> runs{0};
    std::string received;
    std::mutex m;
    scheduler_->registerHandler("test.job", [&](const std::string& payload) {
        std::lock_guard<std::mutex> lock(m);
        received = payload;
        ++runs;
    });
    scheduler_->start();

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(scheduler_->scheduleOnce("k1", "test.job", in(150ms), "hello"));
    EXPECT_TRUE(scheduler_->isPending("k1"));

    ASSERT_TRUE(waitUntil([&] { return runs.load() == 1; }));
    EXPECT_GE(std::chrono::steady_clock::now() - started, 100ms);
    EXPECT_FALSE(scheduler_->isPending("k1"));

    std::lock_guard<std::mutex> lock(m);
    EXPECT_EQ(received, "hello");
}

TEST_F(DelayedJobSchedulerTest, PastDueJobRunsImmediately) {
    std::atomic<int> runs{0};
    scheduler_->registerHandler("test.job", [&](const std::string&) { ++runs; });
    scheduler_->start();

    scheduler_->scheduleOnce("late", "test.job", in(-1000ms), "");

    EXPECT_TRUE(waitUntil([&] { return runs.load() == 1; }, 1000ms));
}

TEST_F(DelayedJobSchedulerTest, DuplicateKeyIsIgnored) {
    EXPECT_TRUE(scheduler_->scheduleOnce("k1", "test.job", in(10s), "a"));
    EXPECT_FALSE(scheduler_->scheduleOnce("k1", "test.job", in(20s), "b"));
    EXPECT_EQ(scheduler_->pendingCount(), 1u);
}

TEST_F(DelayedJobSchedulerTest, CancelPreventsExecution) {
    std::atomic<int> runs{0};
    scheduler_->registerHandler("test.job", [&](const std::string&) { ++runs; });
    scheduler_->start();

    scheduler_->scheduleOnce("k1", "test.job", in(100ms), "");
    EXPECT_TRUE(scheduler_->cancel("k1"));
    EXPECT_FALSE(scheduler_->cancel("k1"));

    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(runs.load(), 0);
    EXPECT_EQ(scheduler_->pendingCount(), 0u);
}

TEST_F(DelayedJobSchedulerTest, RescheduleReplacesPayloadAndTime) {
    std::atomic<int> runs{0};
    std::string received;
    std::mutex m;
    scheduler_->registerHandler("test.job", [&](const std::string& payload) {
        std::lock_guard<std::mutex> lock(m);
        received = payload;
        ++runs;
    });
    scheduler_->start();

    scheduler_->scheduleOnce("k1", "test.job", in(10s), "old");
    scheduler_->reschedule("k1", "test.job", in(50ms), "new");

    ASSERT_TRUE(waitUntil([&] { return runs.load() == 1; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(runs.load(), 1);

    std::lock_guard<std::mutex> lock(m);
    EXPECT_EQ(received, "new");
}

// ============================================================================
// RETRIES
// ============================================================================

TEST_F(DelayedJobSchedulerTest, RetriesFailedJobUntilSuccess) {
    std::atomic<int> attempts{0};
    scheduler_->registerHandler("flaky", [&](const std::string&) {
        if (++attempts < 3) {
            throw std::runtime_error("database unavailable");
        }
    });
    scheduler_->start();

    scheduler_->scheduleOnce("k1", "flaky", in(0ms), "");

    ASSERT_TRUE(waitUntil([&] { return attempts.load() == 3; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(attempts.load(), 3);
    EXPECT_TRUE(scheduler_->failedJobs().empty());
}

TEST_F(DelayedJobSchedulerTest, ExhaustedJobIsRecordedAsFailed) {
    std::atomic<int> attempts{0};
    scheduler_->registerHandler("broken", [&](const std::string&) {
        ++attempts;
        throw std::runtime_error("always fails");
    });
    scheduler_->start();

    scheduler_->scheduleOnce("k1", "broken", in(0ms), "payload");

    ASSERT_TRUE(waitUntil([&] { return !scheduler_->failedJobs().empty(); }));
    auto failed = scheduler_->failedJobs();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].key, "k1");
    EXPECT_EQ(failed[0].jobName, "broken");
    EXPECT_EQ(failed[0].payload, "payload");
    EXPECT_EQ(failed[0].attempts, 3);
    EXPECT_EQ(failed[0].lastError, "always fails");
    EXPECT_EQ(attempts.load(), 3);
}

TEST_F(DelayedJobSchedulerTest, MissingHandlerCountsAsFailure) {
    scheduler_->start();

    scheduler_->scheduleOnce("k1", "unknown.job", in(0ms), "");

    ASSERT_TRUE(waitUntil([&] { return !scheduler_->failedJobs().empty(); }));
    EXPECT_EQ(scheduler_->failedJobs()[0].lastError, "No handler registered for unknown.job");
}

TEST_F(DelayedJobSchedulerTest, JobsScheduledBeforeStartRunAfterStart) {
    std::atomic<int> runs{0};
    scheduler_->registerHandler("test.job", [&](const std::string&) { ++runs; });

    scheduler_->scheduleOnce("a", "test.job", in(0ms), "");
    scheduler_->scheduleOnce("b", "test.job", in(0ms), "");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(runs.load(), 0);

    scheduler_->start();
    EXPECT_TRUE(waitUntil([&] { return runs.load() == 2; }));
}
