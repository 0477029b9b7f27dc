#pragma once

#include "../types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace lore {
namespace storage {

/**
 * @brief Hit/miss counters for an ObjectCache
 */
struct CacheStats {
    size_t hits = 0;       ///< Served from disk
    size_t misses = 0;     ///< Fetched because no usable entry existed
    size_t refreshes = 0;  ///< Fetched because the entry had outlived the TTL
};

/**
 * @brief On-disk download cache for object-store reads
 *
 * Bodies live under <root>/objects/<key>; a SQLite manifest at
 * <root>/cache.sqlite records each key's size and fetch time. Entries older
 * than the TTL are fetched again; a TTL of zero keeps entries forever.
 *
 * The cache is advisory. A missing or unreadable body is treated as a miss,
 * and failures to write the cache never fail the read that triggered them.
 *
 * @threadsafety All methods are thread-safe. Fetchers run without the
 * manifest lock held.
 */
class ObjectCache {
public:
    using Fetcher = std::function<Expected<std::string>()>;
    using NowFn = std::function<std::chrono::system_clock::time_point()>;

    ~ObjectCache();

    ObjectCache(const ObjectCache&) = delete;
    ObjectCache& operator=(const ObjectCache&) = delete;

    /**
     * @brief Open or create a cache rooted at root
     *
     * @param root Cache directory (created if missing)
     * @param ttl Entry lifetime; zero disables expiry
     * @param now Clock used for fetch times (injectable for tests)
     */
    static Expected<std::shared_ptr<ObjectCache>> open(
        const std::filesystem::path& root,
        std::chrono::seconds ttl,
        NowFn now = [] { return std::chrono::system_clock::now(); }
    );

    /**
     * @brief Return the cached body for key, calling fetch on a miss or stale entry
     *
     * @return Expected<std::string> Body, or the fetcher's error
     */
    Expected<std::string> get_or_fetch(const std::string& key, const Fetcher& fetch);

    /**
     * @brief Store a body that is already known (e.g. just uploaded)
     */
    Expected<void> put(const std::string& key, const std::string& data);

    /**
     * @brief Drop every entry whose key starts with prefix
     */
    Expected<void> evict_prefix(const std::string& prefix);

    /** @brief Number of manifest entries. */
    Expected<size_t> size() const;

    CacheStats stats() const;

    /** @brief Scratch area for transient work (e.g. archive extraction). */
    std::filesystem::path scratch_dir() const {
        return root_ / "scratch";
    }

    const std::filesystem::path& root() const {
        return root_;
    }

private:
    ObjectCache(sqlite3* db, std::filesystem::path root, std::chrono::seconds ttl, NowFn now)
        : db_(db)
        , root_(std::move(root))
        , ttl_(ttl)
        , now_(std::move(now))
    {}

    Expected<void> initialize_schema();
    Expected<std::filesystem::path> body_path(const std::string& key) const;
    Expected<void> write_body(const std::string& key, const std::string& data);
    Error make_sql_error(const std::string& prefix) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_lookup_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_size_ = nullptr;

    std::filesystem::path root_;
    std::chrono::seconds ttl_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::atomic<uint64_t> tmp_counter_{0};
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> refreshes_{0};
};

} // namespace storage
} // namespace lore
