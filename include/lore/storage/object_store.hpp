#pragma once

#include "../registry/registry_store.hpp"
#include "../types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lore {
namespace storage {

/**
 * @brief Metadata for one listed object
 */
struct ObjectInfo {
    std::string name;    ///< Full object key
    uint64_t size = 0;   ///< Size in bytes
};

/**
 * @brief Abstract interface over a bucket-based object store
 *
 * Keeps the cloud backend independent of the wire protocol and enables
 * dependency injection for testing. Every call takes a Deadline and fails
 * with ErrorCode::Timeout once it has passed.
 */
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    virtual Expected<bool> bucket_exists(const Deadline& deadline) = 0;

    /**
     * @brief Create the configured bucket
     *
     * @param project_id Project that owns the new bucket
     */
    virtual Expected<void> create_bucket(const std::string& project_id, const Deadline& deadline) = 0;

    /**
     * @brief Upload an object, replacing any existing one with the same key
     */
    virtual Expected<void> put_object(
        const std::string& key,
        const std::string& data,
        const std::string& content_type,
        const Deadline& deadline
    ) = 0;

    /**
     * @brief Download an object
     *
     * @return Expected<std::string> Object bytes or ErrorCode::NotFound
     */
    virtual Expected<std::string> get_object(const std::string& key, const Deadline& deadline) = 0;

    /**
     * @brief List every object whose key starts with prefix
     */
    virtual Expected<std::vector<ObjectInfo>> list_objects(const std::string& prefix, const Deadline& deadline) = 0;

    /**
     * @brief Delete an object (NotFound when it does not exist)
     */
    virtual Expected<void> delete_object(const std::string& key, const Deadline& deadline) = 0;

    /** @brief Bucket name, used in logs and error context. */
    virtual std::string bucket() const = 0;
};

/**
 * @brief Connection settings for GcsObjectStore
 */
struct GcsOptions {
    std::string bucket;
    std::string endpoint = "https://storage.googleapis.com";  ///< API root (emulator override)
    std::string credentials_file;                              ///< Empty = anonymous
    std::chrono::seconds request_timeout{60};                  ///< Per-request cap
};

/**
 * @brief IObjectStore speaking the Google Cloud Storage JSON API over libcurl
 *
 * Credentials are either a JSON file holding an "access_token" or a
 * service-account key ("type": "service_account"), in which case an
 * RS256-signed assertion is exchanged at the key's token_uri and the access
 * token is cached until shortly before it expires.
 *
 * @return Expected<std::unique_ptr<IObjectStore>> Store or InvalidConfig for
 *         an empty bucket or unusable credentials file
 */
Expected<std::unique_ptr<IObjectStore>> make_gcs_object_store(GcsOptions options);

/**
 * @brief Registry sink that keeps the document as a single object
 */
class ObjectRegistryStore : public registry::IRegistryStore {
public:
    ObjectRegistryStore(std::shared_ptr<IObjectStore> store, std::string key = "registry.json")
        : store_(std::move(store))
        , key_(std::move(key))
    {}

    Expected<std::optional<std::string>> load() override {
        auto data = store_->get_object(key_, Deadline::none());
        if (!data) {
            if (data.error().code == ErrorCode::NotFound) {
                return std::optional<std::string>{};
            }
            return tl::unexpected(data.error());
        }
        return std::optional<std::string>{std::move(*data)};
    }

    Expected<void> save(const std::string& serialized) override {
        return store_->put_object(key_, serialized, "application/json", Deadline::none());
    }

    std::string location() const override {
        return "gs://" + store_->bucket() + "/" + key_;
    }

private:
    std::shared_ptr<IObjectStore> store_;
    std::string key_;
};

namespace detail {

/// Percent-encodes an object name for use as a single URL path segment.
std::string url_encode(const std::string& value);

/// Normalizes STORAGE_EMULATOR_HOST style values ("host:port") to a URL.
std::string normalize_endpoint(const std::string& endpoint);

} // namespace detail

} // namespace storage
} // namespace lore
