// =============================================================================
// docrecon - Job Guard
// =============================================================================
// Per-job mutual exclusion for result commits.
//
// Reconstruction itself is pure and needs no locking; only the commit of a
// job's results must not interleave with another commit of the same job.
// JobGuard keeps one reentrant timed mutex per job id:
//
// - acquire() waits at most the configured timeout, then fails with
//   ErrorCode::kTimeout (retryable)
// - the thread that holds a job may acquire it again without waiting; each
//   lease releases one level
// - JobLease releases on destruction, on every path
// - an entry with no holds and no waiters is erased on release, so the map
//   only ever holds jobs that are in flight
//
// executeIdempotent() wraps a write in the job lock and treats a duplicate-key
// failure as a lost race: it re-reads instead of retrying.
// =============================================================================

#ifndef DOCRECON_CONCURRENCY_JOB_GUARD_H
#define DOCRECON_CONCURRENCY_JOB_GUARD_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "docrecon/common/config.h"
#include "docrecon/common/error.h"
#include "docrecon/common/logger.h"
#include "docrecon/common/types.h"

namespace docrecon::concurrency {

class JobGuard;

namespace detail {

struct JobLockEntry {
    std::recursive_timed_mutex mutex;
    std::size_t waiters = 0;

    /// Outstanding leases; nested acquisitions by the owner count each time.
    std::size_t holds = 0;
};

}  // namespace detail

// =============================================================================
// JobLease
// =============================================================================

/// @brief Ownership of one job's lock. Move-only; releases on destruction.
/// @note Must be released on the thread that acquired it.
class JobLease {
public:
    JobLease() = default;

    ~JobLease() { release(); }

    JobLease(const JobLease&) = delete;
    JobLease& operator=(const JobLease&) = delete;

    JobLease(JobLease&& other) noexcept
        : guard_(std::exchange(other.guard_, nullptr)),
          jobId_(std::move(other.jobId_)),
          entry_(std::move(other.entry_)) {}

    JobLease& operator=(JobLease&& other) noexcept {
        if (this != &other) {
            release();
            guard_ = std::exchange(other.guard_, nullptr);
            jobId_ = std::move(other.jobId_);
            entry_ = std::move(other.entry_);
        }
        return *this;
    }

    /// @brief Release early. Idempotent.
    void release() noexcept;

    [[nodiscard]] bool owns() const noexcept { return guard_ != nullptr; }

    [[nodiscard]] const JobId& jobId() const noexcept { return jobId_; }

private:
    friend class JobGuard;

    JobLease(JobGuard* guard, JobId jobId, std::shared_ptr<detail::JobLockEntry> entry) noexcept
        : guard_(guard), jobId_(std::move(jobId)), entry_(std::move(entry)) {}

    JobGuard* guard_ = nullptr;
    JobId jobId_;
    std::shared_ptr<detail::JobLockEntry> entry_;
};

// =============================================================================
// JobGuard
// =============================================================================

class JobGuard {
public:
    explicit JobGuard(std::chrono::milliseconds timeout = kDefaultJobLockTimeout) noexcept
        : timeout_(timeout) {}

    JobGuard(const JobGuard&) = delete;
    JobGuard& operator=(const JobGuard&) = delete;

    /// @brief Lock @p jobId, waiting at most the configured timeout.
    /// @return A lease, or ErrorCode::kTimeout.
    [[nodiscard]] Result<JobLease> acquire(const JobId& jobId);

    /// @brief Lock @p jobId, waiting at most @p timeout.
    [[nodiscard]] Result<JobLease> acquire(const JobId& jobId, std::chrono::milliseconds timeout);

    /// @brief Run @p write under the job lock; on a duplicate key run @p reread.
    ///
    /// Both callables return the same Result<T>. A duplicate key means another
    /// commit of this job won the race; its result is read back instead, and
    /// the write is not retried.
    template <typename WriteFn, typename RereadFn>
    [[nodiscard]] auto executeIdempotent(const JobId& jobId, WriteFn&& write, RereadFn&& reread)
        -> std::invoke_result_t<WriteFn&> {
        using ResultType = std::invoke_result_t<WriteFn&>;
        static_assert(std::is_same_v<ResultType, std::invoke_result_t<RereadFn&>>,
                      "write and reread must return the same Result type");

        auto lease = acquire(jobId);
        if (!lease) {
            return ResultType{std::unexpect, lease.error()};
        }

        ResultType written = std::invoke(write);
        if (!written && written.error().code() == ErrorCode::kDuplicateKey) {
            DOCRECON_LOG_INFO("Job {}: result already committed, reading it back", jobId);
            return std::invoke(reread);
        }
        return written;
    }

    /// @brief Jobs whose lock is currently held.
    [[nodiscard]] std::size_t activeLockCount() const;

    /// @brief Jobs that currently have a lock entry (held or awaited).
    [[nodiscard]] std::size_t trackedJobCount() const;

    /// @brief Callers blocked waiting for @p jobId.
    [[nodiscard]] std::size_t waiterCount(const JobId& jobId) const;

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    /// @brief Log the lock table at INFO level.
    void logStats() const;

    /// @brief Drop every entry that is neither held nor awaited.
    /// @note Held entries survive; erasing them would let a second caller in.
    void clear();

private:
    friend class JobLease;

    void release(const JobId& jobId, const std::shared_ptr<detail::JobLockEntry>& entry) noexcept;

    mutable std::mutex mapMutex_;
    std::unordered_map<JobId, std::shared_ptr<detail::JobLockEntry>> entries_;
    std::chrono::milliseconds timeout_;
};

}  // namespace docrecon::concurrency

#endif  // DOCRECON_CONCURRENCY_JOB_GUARD_H
