#include "lore/storage/cloud_storage.hpp"
#include "lore/storage/local_storage.hpp"
#include "lore/log.hpp"

namespace lore {
namespace storage {

Expected<std::unique_ptr<IStorageBackend>> create_storage_backend(const StorageConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }

    log::logger()->info("Initializing storage backend type={}", storage_type_to_string(config.type));

    switch (config.type) {
        case StorageType::Local: {
            auto backend = LocalStorageBackend::open(config.local_path, config.default_agent);
            if (!backend) {
                return tl::unexpected(backend.error());
            }
            return std::unique_ptr<IStorageBackend>(std::move(*backend));
        }

        case StorageType::Cloud: {
            GcsOptions gcs;
            gcs.bucket = config.bucket;
            gcs.credentials_file = config.credentials_file;
            if (!config.endpoint.empty()) {
                gcs.endpoint = config.endpoint;
            }
            auto store = make_gcs_object_store(std::move(gcs));
            if (!store) {
                return tl::unexpected(store.error());
            }

            auto cache = ObjectCache::open(config.resolved_cache_dir(), config.cache_ttl);
            if (!cache) {
                return tl::unexpected(cache.error());
            }

            CloudStorageOptions options;
            options.project_id = config.project_id;
            options.operation_timeout = config.operation_timeout;
            options.default_agent = config.default_agent;

            auto backend = CloudStorageBackend::open(
                std::shared_ptr<IObjectStore>(std::move(*store)), std::move(*cache), std::move(options));
            if (!backend) {
                return tl::unexpected(backend.error());
            }
            return std::unique_ptr<IStorageBackend>(std::move(*backend));
        }
    }

    return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unsupported storage type"});
}

} // namespace storage
} // namespace lore
