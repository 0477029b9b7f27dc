#pragma once

#include "types.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace lore {

// ============================================================================
// Storage Configuration
// ============================================================================

enum class StorageType {
    Local,
    Cloud
};

[[nodiscard]] inline const char* storage_type_to_string(StorageType type) {
    switch (type) {
        case StorageType::Local: return "local";
        case StorageType::Cloud: return "gcp";
    }
    return "unknown";
}

inline Expected<StorageType> storage_type_from_string(const std::string& value) {
    if (value == "local") {
        return StorageType::Local;
    }
    if (value == "gcp" || value == "cloud") {
        return StorageType::Cloud;
    }
    return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown storage type", value});
}

/**
 * @brief Identity of the agent seeded into a brand-new registry
 */
struct DefaultAgentConfig {
    std::string id = "default";
    std::string name = "Default Agent";
    std::string description = "Default knowledge agent";
    std::string tenant_id = "default";

    bool operator==(const DefaultAgentConfig& other) const {
        return id == other.id && name == other.name &&
               description == other.description && tenant_id == other.tenant_id;
    }

    bool operator!=(const DefaultAgentConfig& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Complete configuration for storage backend construction
 *
 * Resolved once when the backend is built; the engine never re-reads it.
 * Must be validated via validate() before use.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct StorageConfig {
    StorageType type = StorageType::Local;                  ///< Backend selection

    // Local backend
    std::string local_path = "knowledge";                   ///< Knowledge-base root directory

    // Cloud backend
    std::string bucket;                                     ///< Bucket name (required for Cloud)
    std::string project_id;                                 ///< Project used when creating the bucket
    std::string credentials_file;                           ///< Optional credentials JSON path
    std::string endpoint;                                   ///< Optional API endpoint override (emulators)
    std::string cache_dir;                                  ///< Local object cache root (empty = temp dir)
    std::chrono::seconds cache_ttl{3600};                   ///< Cache entry lifetime (0 = never stale)
    std::chrono::seconds operation_timeout{30};             ///< Default budget for bulk object sweeps

    DefaultAgentConfig default_agent;                       ///< Agent seeded into a new registry

    /// Cache root, falling back to a directory under the system temp dir.
    std::filesystem::path resolved_cache_dir() const {
        if (!cache_dir.empty()) {
            return cache_dir;
        }
        return std::filesystem::temp_directory_path() / "lore-knowledge-cache";
    }

    Expected<void> validate() const {
        if (type == StorageType::Local && local_path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Local storage path cannot be empty"});
        }
        if (type == StorageType::Cloud && bucket.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "GCP_STORAGE_BUCKET must be set when using GCP storage"});
        }
        if (cache_ttl.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cache TTL cannot be negative"});
        }
        if (operation_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Operation timeout must be positive"});
        }
        if (default_agent.id.empty() || default_agent.name.empty() || default_agent.tenant_id.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Default agent requires id, name and tenant"});
        }
        return {};
    }

    /**
     * @brief Build a configuration from the process environment
     *
     * Unset variables keep their defaults. Malformed numbers are reported
     * as InvalidConfig rather than silently ignored.
     */
    static Expected<StorageConfig> from_env() {
        StorageConfig config;

        auto env = [](const char* name) -> std::optional<std::string> {
            const char* value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string(value);
        };

        auto seconds_from = [](const std::string& name, const std::string& raw) -> Expected<std::chrono::seconds> {
            try {
                size_t used = 0;
                const long long value = std::stoll(raw, &used);
                if (used != raw.size()) {
                    throw std::invalid_argument("trailing characters");
                }
                return std::chrono::seconds{value};
            } catch (const std::exception&) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Invalid integer for " + name, raw});
            }
        };

        if (auto type = env("STORAGE_TYPE")) {
            auto parsed = storage_type_from_string(*type);
            if (!parsed) {
                return tl::unexpected(parsed.error());
            }
            config.type = *parsed;
        }
        if (auto value = env("LOCAL_STORAGE_PATH")) config.local_path = *value;
        if (auto value = env("GCP_STORAGE_BUCKET")) config.bucket = *value;
        if (auto value = env("GCP_PROJECT_ID")) config.project_id = *value;
        if (auto value = env("GCP_KEY_FILE")) config.credentials_file = *value;
        if (auto value = env("STORAGE_EMULATOR_HOST")) config.endpoint = *value;
        if (auto value = env("KNOWLEDGE_CACHE_DIR")) config.cache_dir = *value;

        if (auto value = env("KNOWLEDGE_CACHE_TTL_SECONDS")) {
            auto ttl = seconds_from("KNOWLEDGE_CACHE_TTL_SECONDS", *value);
            if (!ttl) {
                return tl::unexpected(ttl.error());
            }
            config.cache_ttl = *ttl;
        }
        if (auto value = env("KNOWLEDGE_OPERATION_TIMEOUT_SECONDS")) {
            auto timeout = seconds_from("KNOWLEDGE_OPERATION_TIMEOUT_SECONDS", *value);
            if (!timeout) {
                return tl::unexpected(timeout.error());
            }
            config.operation_timeout = *timeout;
        }

        return config;
    }

    bool operator==(const StorageConfig& other) const {
        return type == other.type &&
               local_path == other.local_path &&
               bucket == other.bucket &&
               project_id == other.project_id &&
               credentials_file == other.credentials_file &&
               endpoint == other.endpoint &&
               cache_dir == other.cache_dir &&
               cache_ttl == other.cache_ttl &&
               operation_timeout == other.operation_timeout &&
               default_agent == other.default_agent;
    }

    bool operator!=(const StorageConfig& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Parse a StorageConfig from a JSON object
 *
 * Keys mirror the environment variables in snake_case; absent keys keep
 * their defaults.
 */
inline Expected<StorageConfig> storage_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Storage config must be a JSON object"});
    }

    StorageConfig config;
    try {
        if (j.contains("type")) {
            auto parsed = storage_type_from_string(j.at("type").get<std::string>());
            if (!parsed) {
                return tl::unexpected(parsed.error());
            }
            config.type = *parsed;
        }
        config.local_path = j.value("local_path", config.local_path);
        config.bucket = j.value("bucket", config.bucket);
        config.project_id = j.value("project_id", config.project_id);
        config.credentials_file = j.value("credentials_file", config.credentials_file);
        config.endpoint = j.value("endpoint", config.endpoint);
        config.cache_dir = j.value("cache_dir", config.cache_dir);
        config.cache_ttl = std::chrono::seconds{j.value("cache_ttl_seconds", static_cast<long long>(config.cache_ttl.count()))};
        config.operation_timeout = std::chrono::seconds{
            j.value("operation_timeout_seconds", static_cast<long long>(config.operation_timeout.count()))};

        if (j.contains("default_agent")) {
            const auto& agent = j.at("default_agent");
            config.default_agent.id = agent.value("id", config.default_agent.id);
            config.default_agent.name = agent.value("name", config.default_agent.name);
            config.default_agent.description = agent.value("description", config.default_agent.description);
            config.default_agent.tenant_id = agent.value("tenant_id", config.default_agent.tenant_id);
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            std::string("Invalid storage config JSON: ") + e.what()
        });
    }
    return config;
}

// ============================================================================
// Retriever Configuration
// ============================================================================

/**
 * @brief Token budget settings for knowledge context assembly
 */
struct RetrieverConfig {
    double tokens_per_char = 0.25;                  ///< Rough token estimate per character
    int max_context_tokens = 50000;                 ///< Hard ceiling for the assembled context
    std::string header = "# Knowledge Base\n\n";    ///< Prefix of every non-empty context

    Expected<void> validate() const {
        if (!std::isfinite(tokens_per_char) || tokens_per_char <= 0.0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "tokens_per_char must be positive"});
        }
        if (max_context_tokens <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_context_tokens must be positive"});
        }
        return {};
    }
};

} // namespace lore
