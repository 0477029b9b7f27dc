#include "lore/storage/object_cache.hpp"
#include "lore/archive/archive_extractor.hpp"
#include "lore/log.hpp"

#include <fstream>
#include <optional>
#include <sqlite3.h>
#include <sstream>
#include <system_error>

namespace lore {
namespace storage {

namespace {

int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

} // namespace

ObjectCache::~ObjectCache() {
    if (stmt_lookup_ != nullptr) {
        sqlite3_finalize(stmt_lookup_);
        stmt_lookup_ = nullptr;
    }
    if (stmt_upsert_ != nullptr) {
        sqlite3_finalize(stmt_upsert_);
        stmt_upsert_ = nullptr;
    }
    if (stmt_size_ != nullptr) {
        sqlite3_finalize(stmt_size_);
        stmt_size_ = nullptr;
    }
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Expected<std::shared_ptr<ObjectCache>> ObjectCache::open(
    const std::filesystem::path& root,
    std::chrono::seconds ttl,
    NowFn now
) {
    if (root.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cache directory cannot be empty"});
    }
    if (ttl.count() < 0) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cache TTL cannot be negative"});
    }

    std::error_code ec;
    std::filesystem::create_directories(root / "objects", ec);
    if (ec) {
        return tl::unexpected(Error{
            ErrorCode::StorageWriteFailed,
            "Failed to create cache directory: " + ec.message(),
            root.string()
        });
    }

    const std::string db_path = (root / "cache.sqlite").string();
    sqlite3* db = nullptr;
    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        std::string message = "Failed to open cache manifest";
        if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
            message += std::string(": ") + sqlite3_errmsg(db);
        }
        if (db != nullptr) {
            sqlite3_close(db);
        }
        return tl::unexpected(Error{ErrorCode::StorageReadFailed, std::move(message), db_path});
    }
    sqlite3_busy_timeout(db, 5000);

    auto instance = std::shared_ptr<ObjectCache>(new ObjectCache(db, root, ttl, std::move(now)));
    auto init_result = instance->initialize_schema();
    if (!init_result) {
        return tl::unexpected(init_result.error());
    }

    log::logger()->debug("Object cache ready root={} ttl_seconds={}", root.string(), ttl.count());
    return instance;
}

Expected<std::string> ObjectCache::get_or_fetch(const std::string& key, const Fetcher& fetch) {
    auto path = body_path(key);
    if (!path) {
        return tl::unexpected(path.error());
    }

    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sqlite3_bind_text(stmt_lookup_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt_lookup_) == SQLITE_ROW) {
            const int64_t fetched_at = sqlite3_column_int64(stmt_lookup_, 1);
            const int64_t age = to_epoch_seconds(now_()) - fetched_at;
            stale = ttl_.count() > 0 && age >= ttl_.count();
            if (!stale) {
                if (auto body = read_file(*path)) {
                    sqlite3_reset(stmt_lookup_);
                    sqlite3_clear_bindings(stmt_lookup_);
                    ++hits_;
                    log::logger()->trace("Cache hit key={}", key);
                    return std::move(*body);
                }
            }
        }
        sqlite3_reset(stmt_lookup_);
        sqlite3_clear_bindings(stmt_lookup_);
    }

    if (stale) {
        ++refreshes_;
        log::logger()->debug("Cache entry stale, refetching key={}", key);
    } else {
        ++misses_;
        log::logger()->debug("Cache miss key={}", key);
    }

    auto data = fetch();
    if (!data) {
        return tl::unexpected(data.error());
    }
    if (auto stored = put(key, *data); !stored) {
        log::logger()->warn("Failed to cache object key={} error={}", key, stored.error().to_string());
    }
    return data;
}

Expected<void> ObjectCache::put(const std::string& key, const std::string& data) {
    if (auto written = write_body(key, data); !written) {
        return written;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_bind_text(stmt_upsert_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_, 2, static_cast<sqlite3_int64>(data.size()));
    sqlite3_bind_int64(stmt_upsert_, 3, static_cast<sqlite3_int64>(to_epoch_seconds(now_())));
    if (sqlite3_step(stmt_upsert_) != SQLITE_DONE) {
        sqlite3_reset(stmt_upsert_);
        sqlite3_clear_bindings(stmt_upsert_);
        return tl::unexpected(make_sql_error("Failed to record cache entry"));
    }
    sqlite3_reset(stmt_upsert_);
    sqlite3_clear_bindings(stmt_upsert_);
    return {};
}

Expected<void> ObjectCache::evict_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    // Compared as bytes: substr() on TEXT counts characters, not bytes.
    constexpr const char* sql =
        "DELETE FROM cache_entries WHERE substr(CAST(key AS BLOB), 1, ?2) = ?1";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error("Failed to prepare cache eviction"));
    }
    sqlite3_bind_blob(stmt, 1, prefix.data(), static_cast<int>(prefix.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(prefix.size()));
    const int rc = sqlite3_step(stmt);
    const int evicted = sqlite3_changes(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return tl::unexpected(make_sql_error("Failed to evict cache entries"));
    }

    // Bodies are keyed by path, so a directory-shaped prefix maps to one subtree.
    std::string dir_prefix = prefix;
    while (!dir_prefix.empty() && dir_prefix.back() == '/') {
        dir_prefix.pop_back();
    }
    if (!dir_prefix.empty()) {
        if (auto dir = body_path(dir_prefix)) {
            std::error_code ec;
            std::filesystem::remove_all(*dir, ec);
            if (ec) {
                log::logger()->warn("Failed to remove cached bodies prefix={} error={}", prefix, ec.message());
            }
        }
    }

    log::logger()->debug("Evicted cache entries prefix={} count={}", prefix, evicted);
    return {};
}

Expected<size_t> ObjectCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = 0;
    if (sqlite3_step(stmt_size_) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt_size_, 0));
    }
    sqlite3_reset(stmt_size_);
    return count;
}

CacheStats ObjectCache::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.refreshes = refreshes_.load();
    return s;
}

Expected<void> ObjectCache::initialize_schema() {
    char* err_msg = nullptr;
    constexpr const char* schema =
        "CREATE TABLE IF NOT EXISTS cache_entries("
        "key TEXT PRIMARY KEY,"
        "size INTEGER NOT NULL,"
        "fetched_at INTEGER NOT NULL"
        ")";
    if (sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
        sqlite3_free(err_msg);
        return tl::unexpected(Error{ErrorCode::StorageWriteFailed, std::move(message), root_.string()});
    }

    constexpr const char* lookup_sql = "SELECT size, fetched_at FROM cache_entries WHERE key = ?1";
    if (sqlite3_prepare_v2(db_, lookup_sql, -1, &stmt_lookup_, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error("Failed to prepare cache lookup statement"));
    }

    constexpr const char* upsert_sql =
        "INSERT INTO cache_entries(key, size, fetched_at) VALUES (?1, ?2, ?3) "
        "ON CONFLICT(key) DO UPDATE SET size = excluded.size, fetched_at = excluded.fetched_at";
    if (sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt_upsert_, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error("Failed to prepare cache upsert statement"));
    }

    constexpr const char* size_sql = "SELECT COUNT(*) FROM cache_entries";
    if (sqlite3_prepare_v2(db_, size_sql, -1, &stmt_size_, nullptr) != SQLITE_OK) {
        return tl::unexpected(make_sql_error("Failed to prepare cache size statement"));
    }
    return {};
}

Expected<std::filesystem::path> ObjectCache::body_path(const std::string& key) const {
    return archive::resolve_entry_path(root_ / "objects", key);
}

Expected<void> ObjectCache::write_body(const std::string& key, const std::string& data) {
    auto path = body_path(key);
    if (!path) {
        return tl::unexpected(path.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(path->parent_path(), ec);
    if (ec) {
        return tl::unexpected(Error{
            ErrorCode::StorageWriteFailed,
            "Failed to create cache directory: " + ec.message(),
            path->parent_path().string()
        });
    }

    auto tmp_path = *path;
    tmp_path += ".tmp" + std::to_string(tmp_counter_.fetch_add(1));
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            std::filesystem::remove(tmp_path, ec);
            return tl::unexpected(Error{ErrorCode::StorageWriteFailed, "Failed to write cache body", tmp_path.string()});
        }
    }
    std::filesystem::rename(tmp_path, *path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return tl::unexpected(Error{
            ErrorCode::StorageWriteFailed,
            "Failed to replace cache body: " + ec.message(),
            path->string()
        });
    }
    return {};
}

Error ObjectCache::make_sql_error(const std::string& prefix) const {
    return Error{
        ErrorCode::StorageWriteFailed,
        prefix + ": " + sqlite3_errmsg(db_),
        (root_ / "cache.sqlite").string()
    };
}

} // namespace storage
} // namespace lore
