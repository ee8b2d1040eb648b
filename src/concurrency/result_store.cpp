// =============================================================================
// docrecon - Result Store Implementation
// =============================================================================

#include "docrecon/concurrency/result_store.h"

#include <fstream>
#include <iterator>
#include <random>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <xxhash.h>

#include "docrecon/common/logger.h"

namespace docrecon::concurrency {

namespace {

/// Longest encoded job directory name before it is shortened with a hash.
constexpr std::size_t kMaxComponentLength = 200;

[[nodiscard]] bool isSafeChar(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.';
}

/// Job ids come from input documents. Each maps to its own single path
/// component: unsafe bytes (and '%') are written as %XX, "." and ".." are
/// escaped whole, and the empty id becomes "%". Overlong names keep a prefix
/// followed by '~' and the XXH64 of the raw id.
[[nodiscard]] std::string encodeComponent(std::string_view name) {
    if (name.empty()) {
        return "%";
    }
    if (name == "." || name == "..") {
        return name.size() == 1 ? "%2E" : "%2E%2E";
    }

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (isSafeChar(c)) {
            out.push_back(c);
        } else {
            out += fmt::format("%{:02X}", static_cast<unsigned char>(c));
        }
    }
    if (out.size() > kMaxComponentLength) {
        out.resize(kMaxComponentLength - 17);
        out += fmt::format("~{:016x}", fingerprintOf(name));
    }
    return out;
}

/// Temporary name next to @p target, unique across threads and processes.
[[nodiscard]] std::filesystem::path uniqueTempPath(const std::filesystem::path& target) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    auto path = target;
    path += fmt::format(".{:016x}.tmp", rng());
    return path;
}

[[nodiscard]] StoredResult makeRecord(const ResultKey& key, std::string payload) {
    StoredResult record;
    record.key = key;
    record.fingerprint = fingerprintOf(payload);
    record.payload = std::move(payload);
    return record;
}

}  // namespace

Fingerprint fingerprintOf(std::string_view payload) noexcept {
    return XXH64(payload.data(), payload.size(), 0);
}

std::string ResultKey::toString() const {
    return fmt::format("{}#{}", jobId, page);
}

// =============================================================================
// InMemoryResultStore
// =============================================================================

Result<StoredResult> InMemoryResultStore::put(const ResultKey& key, std::string payload) {
    std::lock_guard lock(mutex_);
    if (records_.contains(key)) {
        return makeError<StoredResult>(ErrorCode::kDuplicateKey,
                                       fmt::format("result {} already stored", key.toString()));
    }
    StoredResult record = makeRecord(key, std::move(payload));
    records_.emplace(key, record);
    return record;
}

Result<StoredResult> InMemoryResultStore::get(const ResultKey& key) const {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(key);
    if (it == records_.end()) {
        return makeError<StoredResult>(ErrorCode::kNotFound,
                                       fmt::format("no result stored for {}", key.toString()));
    }
    return it->second;
}

bool InMemoryResultStore::contains(const ResultKey& key) const {
    std::lock_guard lock(mutex_);
    return records_.contains(key);
}

std::size_t InMemoryResultStore::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

// =============================================================================
// DirectoryResultStore
// =============================================================================

DirectoryResultStore::DirectoryResultStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path DirectoryResultStore::pathFor(const ResultKey& key) const {
    return root_ / encodeComponent(key.jobId) / fmt::format("page-{}.json", key.page);
}

Result<StoredResult> DirectoryResultStore::put(const ResultKey& key, std::string payload) {
    const auto target = pathFor(key);
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        return makeError<StoredResult>(
            ErrorCode::kDuplicateKey,
            fmt::format("result {} already stored at {}", key.toString(), target.string()));
    }

    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return makeError<StoredResult>(
            ErrorCode::kIOError, fmt::format("cannot create {}: {}",
                                             target.parent_path().string(), ec.message()));
    }

    const auto tempPath = uniqueTempPath(target);
    {
        std::ofstream stream(tempPath, std::ios::binary | std::ios::trunc);
        if (!stream) {
            return makeError<StoredResult>(ErrorCode::kIOError,
                                           fmt::format("cannot open {}", tempPath.string()));
        }
        stream.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        stream.flush();
        if (!stream) {
            stream.close();
            std::filesystem::remove(tempPath, ec);
            return makeError<StoredResult>(ErrorCode::kIOError,
                                           fmt::format("write to {} failed", tempPath.string()));
        }
    }

    // Linking never replaces an existing file, so exactly one writer wins.
    std::filesystem::create_hard_link(tempPath, target, ec);
    std::error_code removeEc;
    std::filesystem::remove(tempPath, removeEc);
    if (ec == std::errc::file_exists) {
        return makeError<StoredResult>(
            ErrorCode::kDuplicateKey,
            fmt::format("result {} already stored at {}", key.toString(), target.string()));
    }
    if (ec) {
        return makeError<StoredResult>(
            ErrorCode::kIOError,
            fmt::format("cannot move result into {}: {}", target.string(), ec.message()));
    }

    DOCRECON_LOG_DEBUG("Stored {} ({} bytes) at {}", key.toString(), payload.size(),
                       target.string());
    return makeRecord(key, std::move(payload));
}

Result<StoredResult> DirectoryResultStore::get(const ResultKey& key) const {
    const auto target = pathFor(key);
    std::ifstream stream(target, std::ios::binary);
    if (!stream) {
        std::error_code ec;
        if (!std::filesystem::exists(target, ec)) {
            return makeError<StoredResult>(ErrorCode::kNotFound,
                                           fmt::format("no result stored for {}", key.toString()));
        }
        return makeError<StoredResult>(ErrorCode::kIOError,
                                       fmt::format("cannot open {}", target.string()));
    }
    std::string payload{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        return makeError<StoredResult>(ErrorCode::kIOError,
                                       fmt::format("read from {} failed", target.string()));
    }
    return makeRecord(key, std::move(payload));
}

bool DirectoryResultStore::contains(const ResultKey& key) const {
    std::error_code ec;
    return std::filesystem::exists(pathFor(key), ec);
}

// =============================================================================
// Commit
// =============================================================================

Result<StoredResult> commitResult(IResultStore& store, JobGuard& guard, const ResultKey& key,
                                  std::string payload) {
    const Fingerprint expected = fingerprintOf(payload);
    return guard.executeIdempotent(
        key.jobId, [&]() { return store.put(key, payload); },
        [&]() -> Result<StoredResult> {
            auto stored = store.get(key);
            if (stored && stored->fingerprint != expected) {
                DOCRECON_LOG_WARNING(
                    "Result {} was committed concurrently with different content "
                    "(stored {:016x}, ours {:016x})",
                    key.toString(), stored->fingerprint, expected);
            }
            return stored;
        });
}

}  // namespace docrecon::concurrency
