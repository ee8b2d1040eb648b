// =============================================================================
// docrecon - Result Store
// =============================================================================
// Commit targets for finished page reconstructions.
//
// A store accepts each (job, page) key once; a second put() of the same key
// fails with ErrorCode::kDuplicateKey. Every stored payload carries its XXH64
// fingerprint so a re-read can be checked against what was written.
// =============================================================================

#ifndef DOCRECON_CONCURRENCY_RESULT_STORE_H
#define DOCRECON_CONCURRENCY_RESULT_STORE_H

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "docrecon/common/error.h"
#include "docrecon/common/types.h"
#include "docrecon/concurrency/job_guard.h"

namespace docrecon::concurrency {

/// @brief XXH64 of @p payload with seed 0.
[[nodiscard]] Fingerprint fingerprintOf(std::string_view payload) noexcept;

/// @brief Identity of one committed page.
struct ResultKey {
    JobId jobId;
    std::uint32_t page = 0;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] auto operator<=>(const ResultKey&) const = default;
};

struct StoredResult {
    ResultKey key;
    std::string payload;
    Fingerprint fingerprint = 0;
};

// =============================================================================
// Store Interface
// =============================================================================

class IResultStore {
public:
    virtual ~IResultStore() = default;

    /// @brief Store @p payload under @p key.
    /// @return The stored record, or kDuplicateKey if the key exists.
    [[nodiscard]] virtual Result<StoredResult> put(const ResultKey& key, std::string payload) = 0;

    /// @brief The record stored under @p key, or kNotFound.
    [[nodiscard]] virtual Result<StoredResult> get(const ResultKey& key) const = 0;

    [[nodiscard]] virtual bool contains(const ResultKey& key) const = 0;
};

// =============================================================================
// In-Memory Store
// =============================================================================

class InMemoryResultStore final : public IResultStore {
public:
    [[nodiscard]] Result<StoredResult> put(const ResultKey& key, std::string payload) override;
    [[nodiscard]] Result<StoredResult> get(const ResultKey& key) const override;
    [[nodiscard]] bool contains(const ResultKey& key) const override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<ResultKey, StoredResult> records_;
};

// =============================================================================
// Directory Store
// =============================================================================

/// @brief One file per key: <root>/<encoded job>/page-<n>.json. An existing
///        file is a duplicate key.
///
/// Distinct job ids always map to distinct directories. Payloads are written
/// to a private temporary file and hard-linked into place, so a put() never
/// overwrites a committed result.
class DirectoryResultStore final : public IResultStore {
public:
    explicit DirectoryResultStore(std::filesystem::path root);

    [[nodiscard]] Result<StoredResult> put(const ResultKey& key, std::string payload) override;
    [[nodiscard]] Result<StoredResult> get(const ResultKey& key) const override;
    [[nodiscard]] bool contains(const ResultKey& key) const override;

    /// @brief File that holds (or would hold) @p key.
    [[nodiscard]] std::filesystem::path pathFor(const ResultKey& key) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

// =============================================================================
// Commit
// =============================================================================

/// @brief Write @p payload under the job lock; a lost race reads the winner back.
///
/// A read-back whose fingerprint differs from @p payload's is returned as-is
/// and logged as a warning.
[[nodiscard]] Result<StoredResult> commitResult(IResultStore& store, JobGuard& guard,
                                                const ResultKey& key, std::string payload);

}  // namespace docrecon::concurrency

#endif  // DOCRECON_CONCURRENCY_RESULT_STORE_H
