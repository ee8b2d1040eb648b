// =============================================================================
// docrecon - Job Guard Implementation
// =============================================================================

#include "docrecon/concurrency/job_guard.h"

#include <algorithm>

#include <fmt/format.h>

namespace docrecon::concurrency {

// =============================================================================
// JobLease
// =============================================================================

void JobLease::release() noexcept {
    if (guard_ == nullptr) {
        return;
    }
    guard_->release(jobId_, entry_);
    guard_ = nullptr;
    entry_.reset();
}

// =============================================================================
// JobGuard
// =============================================================================

Result<JobLease> JobGuard::acquire(const JobId& jobId) {
    return acquire(jobId, timeout_);
}

Result<JobLease> JobGuard::acquire(const JobId& jobId, std::chrono::milliseconds timeout) {
    std::shared_ptr<detail::JobLockEntry> entry;
    {
        std::lock_guard lock(mapMutex_);
        auto& slot = entries_[jobId];
        if (!slot) {
            slot = std::make_shared<detail::JobLockEntry>();
        }
        entry = slot;
        ++entry->waiters;
    }

    const bool locked = entry->mutex.try_lock_for(timeout);

    std::lock_guard lock(mapMutex_);
    --entry->waiters;
    if (locked) {
        ++entry->holds;
        DOCRECON_LOG_DEBUG("Job {}: lock acquired (depth {})", jobId, entry->holds);
        return JobLease{this, jobId, std::move(entry)};
    }

    if (entry->holds == 0 && entry->waiters == 0) {
        auto it = entries_.find(jobId);
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
        }
    }
    DOCRECON_LOG_WARNING("Job {}: lock wait expired after {}ms", jobId, timeout.count());
    return makeError<JobLease>(
        ErrorCode::kTimeout,
        fmt::format("timed out after {}ms waiting for the lock of job '{}'", timeout.count(), jobId));
}

void JobGuard::release(const JobId& jobId,
                       const std::shared_ptr<detail::JobLockEntry>& entry) noexcept {
    std::lock_guard lock(mapMutex_);
    --entry->holds;
    entry->mutex.unlock();
    if (entry->holds == 0 && entry->waiters == 0) {
        auto it = entries_.find(jobId);
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
        }
    }
}

std::size_t JobGuard::activeLockCount() const {
    std::lock_guard lock(mapMutex_);
    return static_cast<std::size_t>(std::ranges::count_if(
        entries_, [](const auto& item) { return item.second->holds > 0; }));
}

std::size_t JobGuard::trackedJobCount() const {
    std::lock_guard lock(mapMutex_);
    return entries_.size();
}

std::size_t JobGuard::waiterCount(const JobId& jobId) const {
    std::lock_guard lock(mapMutex_);
    const auto it = entries_.find(jobId);
    return it == entries_.end() ? 0 : it->second->waiters;
}

void JobGuard::logStats() const {
    std::lock_guard lock(mapMutex_);
    DOCRECON_LOG_INFO("Job locks: {} tracked, timeout {}ms", entries_.size(), timeout_.count());
    for (const auto& [jobId, entry] : entries_) {
        DOCRECON_LOG_INFO("  job {}: {} hold(s), {} waiter(s)", jobId, entry->holds,
                          entry->waiters);
    }
}

void JobGuard::clear() {
    std::lock_guard lock(mapMutex_);
    std::erase_if(entries_, [](const auto& item) {
        return item.second->holds == 0 && item.second->waiters == 0;
    });
}

}  // namespace docrecon::concurrency
