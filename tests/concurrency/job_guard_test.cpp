// =============================================================================
// docrecon - Job Guard Tests
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "docrecon/concurrency/job_guard.h"

namespace docrecon::test {

using namespace std::chrono_literals;
using concurrency::JobGuard;
using concurrency::JobLease;

namespace {

/// Spin until @p guard reports @p count waiters on @p jobId.
void waitForWaiters(const JobGuard& guard, const JobId& jobId, std::size_t count) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (guard.waiterCount(jobId) < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
}

}  // namespace

TEST(JobGuardTest, AcquireAndRelease) {
    JobGuard guard;
    {
        auto lease = guard.acquire("job-1");
        ASSERT_TRUE(lease.has_value());
        EXPECT_TRUE(lease->owns());
        EXPECT_EQ(lease->jobId(), "job-1");
        EXPECT_EQ(guard.activeLockCount(), 1U);
    }
    EXPECT_EQ(guard.activeLockCount(), 0U);
}

TEST(JobGuardTest, DifferentJobsDoNotBlockEachOther) {
    JobGuard guard(50ms);
    auto first = guard.acquire("a");
    auto second = guard.acquire("b");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(guard.activeLockCount(), 2U);
}

TEST(JobGuardTest, SecondCallerTimesOut) {
    JobGuard guard(20ms);
    auto held = guard.acquire("job");
    ASSERT_TRUE(held.has_value());

    Result<JobLease> contended = makeError<JobLease>(ErrorCode::kInvalidState, "not run");
    std::thread other([&] { contended = guard.acquire("job"); });
    other.join();

    ASSERT_FALSE(contended.has_value());
    EXPECT_EQ(contended.error().code(), ErrorCode::kTimeout);
    EXPECT_TRUE(isRetryable(contended.error().code()));
    EXPECT_EQ(guard.waiterCount("job"), 0U);
    EXPECT_EQ(guard.activeLockCount(), 1U);
}

TEST(JobGuardTest, WaiterProceedsAfterRelease) {
    JobGuard guard(5s);
    auto held = guard.acquire("job");
    ASSERT_TRUE(held.has_value());

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto lease = guard.acquire("job");
        acquired = lease.has_value();
    });

    waitForWaiters(guard, "job", 1);
    EXPECT_FALSE(acquired.load());
    held->release();
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(guard.activeLockCount(), 0U);
}

TEST(JobGuardTest, LeaseMoveTransfersOwnership) {
    JobGuard guard;
    auto acquired = guard.acquire("job");
    ASSERT_TRUE(acquired.has_value());

    JobLease lease = std::move(*acquired);
    EXPECT_FALSE(acquired->owns());
    EXPECT_TRUE(lease.owns());

    lease.release();
    lease.release();
    EXPECT_FALSE(lease.owns());
    EXPECT_EQ(guard.activeLockCount(), 0U);
}

TEST(JobGuardTest, ClearKeepsHeldEntries) {
    JobGuard guard;
    auto held = guard.acquire("job");
    ASSERT_TRUE(held.has_value());
    guard.clear();
    EXPECT_EQ(guard.activeLockCount(), 1U);
    held->release();
    EXPECT_EQ(guard.activeLockCount(), 0U);
}

TEST(JobGuardTest, OwnerMayAcquireAgain) {
    JobGuard guard(20ms);
    auto outer = guard.acquire("job");
    ASSERT_TRUE(outer.has_value());
    auto inner = guard.acquire("job");
    ASSERT_TRUE(inner.has_value());
    EXPECT_EQ(guard.activeLockCount(), 1U);

    inner->release();
    Result<JobLease> contended = makeError<JobLease>(ErrorCode::kInvalidState, "not run");
    std::thread other([&] { contended = guard.acquire("job"); });
    other.join();
    ASSERT_FALSE(contended.has_value());
    EXPECT_EQ(contended.error().code(), ErrorCode::kTimeout);
    EXPECT_EQ(guard.trackedJobCount(), 1U);

    outer->release();
    EXPECT_EQ(guard.activeLockCount(), 0U);
    EXPECT_EQ(guard.trackedJobCount(), 0U);
}

TEST(JobGuardTest, WaitersAreTrackedButNotActive) {
    JobGuard guard(5s);
    auto held = guard.acquire("job");
    ASSERT_TRUE(held.has_value());

    std::thread waiter([&] { auto lease = guard.acquire("job"); });
    waitForWaiters(guard, "job", 1);
    EXPECT_EQ(guard.activeLockCount(), 1U);
    EXPECT_EQ(guard.trackedJobCount(), 1U);
    held->release();
    waiter.join();
    EXPECT_EQ(guard.trackedJobCount(), 0U);
}

TEST(JobGuardTest, SerializesCommitsOfOneJob) {
    JobGuard guard(10s);
    constexpr int kThreads = 8;
    constexpr int kIterations = 200;
    int counter = 0;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kIterations; ++i) {
                auto lease = guard.acquire("shared");
                if (!lease) {
                    ++failures;
                    continue;
                }
                ++counter;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(counter, kThreads * kIterations);
    EXPECT_EQ(guard.activeLockCount(), 0U);
}

// =============================================================================
// executeIdempotent
// =============================================================================

TEST(ExecuteIdempotentTest, SuccessfulWriteSkipsReread) {
    JobGuard guard;
    int rereads = 0;
    const auto result = guard.executeIdempotent(
        "job", [] { return Result<int>{7}; },
        [&] {
            ++rereads;
            return Result<int>{0};
        });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
    EXPECT_EQ(rereads, 0);
}

TEST(ExecuteIdempotentTest, DuplicateKeyReadsBack) {
    JobGuard guard;
    int writes = 0;
    const auto result = guard.executeIdempotent(
        "job",
        [&] {
            ++writes;
            return makeError<int>(ErrorCode::kDuplicateKey, "exists");
        },
        [] { return Result<int>{42}; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(writes, 1);
}

TEST(ExecuteIdempotentTest, OtherErrorsPropagate) {
    JobGuard guard;
    const auto result = guard.executeIdempotent(
        "job", [] { return makeError<int>(ErrorCode::kIOError, "disk full"); },
        [] { return Result<int>{1}; });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
}

TEST(ExecuteIdempotentTest, NestedCallForSameJobDoesNotWait) {
    JobGuard guard(20ms);
    const auto result = guard.executeIdempotent(
        "job",
        [&] {
            return guard.executeIdempotent(
                "job", [] { return Result<int>{5}; }, [] { return Result<int>{0}; });
        },
        [] { return Result<int>{0}; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 5);
    EXPECT_EQ(guard.trackedJobCount(), 0U);
}

TEST(ExecuteIdempotentTest, LockTimeoutSkipsWrite) {
    JobGuard guard(10ms);
    auto held = guard.acquire("job");
    ASSERT_TRUE(held.has_value());

    bool wrote = false;
    Result<int> result{0};
    std::thread other([&] {
        result = guard.executeIdempotent(
            "job",
            [&] {
                wrote = true;
                return Result<int>{1};
            },
            [] { return Result<int>{2}; });
    });
    other.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kTimeout);
    EXPECT_FALSE(wrote);
}

}  // namespace docrecon::test
