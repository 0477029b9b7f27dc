#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace lore {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Caller errors (validation, lookups, duplicates)
 * - 300-399: Archive errors
 * - 400-499: Storage and registry errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,

    // Caller errors (200-299)
    Validation = 200,
    NotFound = 201,
    AlreadyExists = 202,

    // Archive errors (300-399)
    InvalidArchiveEntry = 300,
    ArchiveReadFailed = 301,

    // Storage errors (400-499)
    StorageWriteFailed = 400,
    StorageReadFailed = 401,
    RegistryPersistFailed = 402,
    RegistryCorrupt = 403,
    Timeout = 404,

    // Unknown
    Unknown = 999
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::Validation: return "Validation";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArchiveEntry: return "InvalidArchiveEntry";
        case ErrorCode::ArchiveReadFailed: return "ArchiveReadFailed";
        case ErrorCode::StorageWriteFailed: return "StorageWriteFailed";
        case ErrorCode::StorageReadFailed: return "StorageReadFailed";
        case ErrorCode::RegistryPersistFailed: return "RegistryPersistFailed";
        case ErrorCode::RegistryCorrupt: return "RegistryCorrupt";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., file paths, object keys)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message && context == other.context;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Deadlines
// ============================================================================

/**
 * @brief Optional operation-level time budget
 *
 * A default-constructed Deadline never expires. Storage operations check it
 * between steps and fail with ErrorCode::Timeout once it has passed; work
 * already applied is left in place.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline() = default;

    static Deadline none() {
        return Deadline{};
    }

    static Deadline after(std::chrono::milliseconds budget) {
        Deadline d;
        d.at_ = Clock::now() + budget;
        return d;
    }

    static Deadline at(Clock::time_point when) {
        Deadline d;
        d.at_ = when;
        return d;
    }

    bool has_value() const {
        return at_.has_value();
    }

    bool expired() const {
        return at_.has_value() && Clock::now() >= *at_;
    }

    /// Remaining budget, clamped at zero; nullopt when unbounded.
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!at_) {
            return std::nullopt;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*at_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    /// This deadline if bounded, otherwise one that expires after `fallback`.
    Deadline or_after(std::chrono::milliseconds fallback) const {
        return at_ ? *this : after(fallback);
    }

    Expected<void> check(const std::string& operation) const {
        if (expired()) {
            return tl::unexpected(Error{
                ErrorCode::Timeout,
                "Deadline exceeded during " + operation
            });
        }
        return {};
    }

private:
    std::optional<Clock::time_point> at_;
};

// ============================================================================
// Timestamps
// ============================================================================

using Timestamp = std::chrono::system_clock::time_point;

namespace detail {

/// RFC 3339 in UTC with microsecond precision, e.g. 2024-05-01T12:30:00.123456Z
inline std::string format_timestamp(Timestamp ts) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        ts.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(micros / 1000000);
    long frac = static_cast<long>(micros % 1000000);
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return buf;
}

/// Parses RFC 3339 timestamps with optional fraction and a Z or +hh:mm offset.
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    long offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        int hh = 0;
        int mm = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hh, &mm) != 2) {
            return std::nullopt;
        }
        offset_seconds = sign * (hh * 3600L + mm * 60L);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::time_t utc = timegm(&tm) - offset_seconds;
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds{utc} + std::chrono::nanoseconds{nanos})};
}

inline Timestamp now_micros() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

} // namespace detail

// ============================================================================
// Registry Records
// ============================================================================

/**
 * @brief An independently-branded assistant identity with its own knowledge scope
 *
 * The api_key is only populated inside the registry; every copy handed to a
 * caller has it cleared.
 */
struct Agent {
    std::string id;            ///< Globally unique, caller supplied, immutable
    std::string name;          ///< Display name
    std::string description;   ///< Display description
    std::string tenant_id;     ///< Logical grouping (bookkeeping only)
    std::string api_key;       ///< Generated at creation; empty in caller-facing copies
    Timestamp created_at{};    ///< Creation time (UTC)

    /// Copy with the API key removed.
    Agent redacted() const {
        Agent copy = *this;
        copy.api_key.clear();
        return copy;
    }

    bool operator==(const Agent& other) const {
        return id == other.id &&
               name == other.name &&
               description == other.description &&
               tenant_id == other.tenant_id &&
               api_key == other.api_key &&
               created_at == other.created_at;
    }

    bool operator!=(const Agent& other) const {
        return !(*this == other);
    }
};

/**
 * @brief An uploaded archive plus its extracted documents
 */
struct KnowledgeFile {
    std::string id;                       ///< Generated UUID
    std::string name;                     ///< Display name
    std::string description;              ///< Display description
    std::string file_path;                ///< Backend-specific locator (directory or key prefix)
    std::vector<std::string> agent_ids;   ///< Agents this file is visible to (non-empty)
    Timestamp uploaded_at{};              ///< Upload time (UTC)
    int64_t file_size = 0;                ///< Size of the raw archive in bytes
    std::string content_type;             ///< Content type reported by the uploader

    bool visible_to(const std::string& agent_id) const {
        for (const auto& id_entry : agent_ids) {
            if (id_entry == agent_id) {
                return true;
            }
        }
        return false;
    }

    bool operator==(const KnowledgeFile& other) const {
        return id == other.id &&
               name == other.name &&
               description == other.description &&
               file_path == other.file_path &&
               agent_ids == other.agent_ids &&
               uploaded_at == other.uploaded_at &&
               file_size == other.file_size &&
               content_type == other.content_type;
    }

    bool operator!=(const KnowledgeFile& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Durable shape of the registry (registry.json)
 */
struct RegistryDocument {
    std::vector<Agent> agents;                   ///< Creation order
    std::vector<KnowledgeFile> knowledge_files;  ///< Upload order

    bool operator==(const RegistryDocument& other) const {
        return agents == other.agents && knowledge_files == other.knowledge_files;
    }

    bool operator!=(const RegistryDocument& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Operation Results
// ============================================================================

/**
 * @brief Statistics reported by the archive extractor
 *
 * Transient; used only to report the upload outcome.
 */
struct ExtractionResult {
    bool success = false;
    size_t files_extracted = 0;
    size_t markdown_files = 0;
    uint64_t total_size_bytes = 0;
    std::optional<Error> error;

    static ExtractionResult failure(Error err) {
        ExtractionResult result;
        result.success = false;
        result.error = std::move(err);
        return result;
    }
};

/** @brief A stored knowledge file and the statistics of its extraction. */
struct UploadResult {
    KnowledgeFile file;
    ExtractionResult extraction;
};

/**
 * @brief Outcome of a best-effort physical cleanup
 *
 * Diagnostic only. A delete whose registry change succeeded is successful
 * regardless of what this reports.
 */
struct CleanupReport {
    size_t objects_deleted = 0;
    size_t objects_failed = 0;
    bool timed_out = false;

    bool complete() const {
        return objects_failed == 0 && !timed_out;
    }
};

// ============================================================================
// JSON Serialization
// ============================================================================

inline void to_json(nlohmann::json& j, const Agent& agent) {
    j = nlohmann::json{
        {"id", agent.id},
        {"name", agent.name},
        {"description", agent.description},
        {"tenant_id", agent.tenant_id},
        {"created_at", detail::format_timestamp(agent.created_at)}
    };
    if (!agent.api_key.empty()) {
        j["api_key"] = agent.api_key;
    }
}

inline void from_json(const nlohmann::json& j, Agent& agent) {
    agent.id = j.at("id").get<std::string>();
    agent.name = j.value("name", "");
    agent.description = j.value("description", "");
    agent.tenant_id = j.value("tenant_id", "");
    agent.api_key = j.value("api_key", "");
    agent.created_at = Timestamp{};
    if (j.contains("created_at")) {
        const auto ts = detail::parse_timestamp(j.at("created_at").get<std::string>());
        if (!ts) {
            throw std::invalid_argument("Invalid created_at timestamp for agent " + agent.id);
        }
        agent.created_at = *ts;
    }
}

inline void to_json(nlohmann::json& j, const KnowledgeFile& file) {
    j = nlohmann::json{
        {"id", file.id},
        {"name", file.name},
        {"description", file.description},
        {"file_path", file.file_path},
        {"agent_ids", file.agent_ids},
        {"uploaded_at", detail::format_timestamp(file.uploaded_at)},
        {"file_size", file.file_size},
        {"content_type", file.content_type}
    };
}

inline void from_json(const nlohmann::json& j, KnowledgeFile& file) {
    file.id = j.at("id").get<std::string>();
    file.name = j.value("name", "");
    file.description = j.value("description", "");
    file.file_path = j.value("file_path", "");
    file.agent_ids.clear();
    if (j.contains("agent_ids") && !j.at("agent_ids").is_null()) {
        file.agent_ids = j.at("agent_ids").get<std::vector<std::string>>();
    }
    file.file_size = j.value("file_size", static_cast<int64_t>(0));
    file.content_type = j.value("content_type", "");
    file.uploaded_at = Timestamp{};
    if (j.contains("uploaded_at")) {
        const auto ts = detail::parse_timestamp(j.at("uploaded_at").get<std::string>());
        if (!ts) {
            throw std::invalid_argument("Invalid uploaded_at timestamp for file " + file.id);
        }
        file.uploaded_at = *ts;
    }
}

inline void to_json(nlohmann::json& j, const RegistryDocument& doc) {
    j = nlohmann::json{
        {"agents", doc.agents},
        {"knowledge_files", doc.knowledge_files}
    };
}

inline void from_json(const nlohmann::json& j, RegistryDocument& doc) {
    if (!j.is_object()) {
        throw std::invalid_argument("Registry root must be a JSON object");
    }
    doc.agents.clear();
    doc.knowledge_files.clear();
    if (j.contains("agents") && !j.at("agents").is_null()) {
        doc.agents = j.at("agents").get<std::vector<Agent>>();
    }
    if (j.contains("knowledge_files") && !j.at("knowledge_files").is_null()) {
        doc.knowledge_files = j.at("knowledge_files").get<std::vector<KnowledgeFile>>();
    }
}

inline void to_json(nlohmann::json& j, const ExtractionResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"files_extracted", result.files_extracted},
        {"markdown_files", result.markdown_files},
        {"total_size_bytes", result.total_size_bytes}
    };
    if (result.error) {
        j["error"] = result.error->message;
    }
}

inline void to_json(nlohmann::json& j, const CleanupReport& report) {
    j = nlohmann::json{
        {"objects_deleted", report.objects_deleted},
        {"objects_failed", report.objects_failed},
        {"timed_out", report.timed_out}
    };
}

} // namespace lore
