#pragma once

#include "../archive/archive_extractor.hpp"
#include "../registry/registry.hpp"
#include "object_cache.hpp"
#include "object_store.hpp"
#include "pending_uploads.hpp"
#include "storage_backend.hpp"
#include <chrono>
#include <memory>

namespace lore {
namespace storage {

/**
 * @brief Settings for CloudStorageBackend beyond the object store itself
 */
struct CloudStorageOptions {
    std::string project_id;                          ///< Used when the bucket must be created
    std::chrono::seconds operation_timeout{30};      ///< Default budget for bulk sweeps
    DefaultAgentConfig default_agent;                ///< Agent seeded into a new registry
};

/**
 * @brief Storage backend on a bucket-based object store
 *
 * Uses the same logical layout as the local backend, as object keys:
 * registry.json, files/<id>/content.zip and files/<id>/extracted/<path>.
 * A KnowledgeFile's file_path is its files/<id> key prefix.
 *
 * Archives are extracted into a scratch directory under the cache root and
 * each document is uploaded individually. Document reads go through the
 * ObjectCache; deletes evict the file's cache entries.
 */
class CloudStorageBackend : public IStorageBackend {
public:
    /**
     * @brief Connect to the bucket, creating it if needed, and load the registry
     *
     * @param store Object store client
     * @param cache Download cache (also provides the extraction scratch area)
     * @param options Project, timeouts and default agent
     */
    static Expected<std::unique_ptr<CloudStorageBackend>> open(
        std::shared_ptr<IObjectStore> store,
        std::shared_ptr<ObjectCache> cache,
        CloudStorageOptions options = {}
    );

    Expected<UploadResult> store_knowledge_file(
        const std::string& name,
        const std::string& description,
        const std::vector<std::string>& agent_ids,
        const std::string& content,
        const std::string& content_type,
        const Deadline& deadline = Deadline::none()
    ) override;

    Expected<KnowledgeFile> get_knowledge_file(const std::string& file_id) override;
    std::vector<KnowledgeFile> get_knowledge_files_for_agent(const std::string& agent_id) override;
    std::vector<KnowledgeFile> get_all_knowledge_files() override;

    Expected<CleanupReport> delete_knowledge_file(
        const std::string& file_id,
        const Deadline& deadline = Deadline::none()
    ) override;

    std::vector<Agent> get_all_agents() override;
    std::optional<Agent> get_agent(const std::string& agent_id) override;

    Expected<Agent> create_agent(
        const std::string& id,
        const std::string& name,
        const std::string& description,
        const std::string& tenant_id
    ) override;

    Expected<std::vector<std::string>> list_documents(
        const KnowledgeFile& file,
        const Deadline& deadline = Deadline::none()
    ) override;

    Expected<std::string> read_document(
        const KnowledgeFile& file,
        const std::string& relative_path,
        const Deadline& deadline = Deadline::none()
    ) override;

    Expected<CleanupReport> sweep_orphans(const Deadline& deadline = Deadline::none()) override;

    std::string backend_name() const override {
        return "cloud";
    }

private:
    CloudStorageBackend(
        std::shared_ptr<IObjectStore> store,
        std::shared_ptr<ObjectCache> cache,
        std::unique_ptr<registry::Registry> registry,
        CloudStorageOptions options
    )
        : store_(std::move(store))
        , cache_(std::move(cache))
        , registry_(std::move(registry))
        , options_(std::move(options))
    {}

    // Uploads every extracted document under <prefix>/extracted/.
    Expected<void> upload_extracted(
        const std::filesystem::path& scratch,
        const std::string& prefix,
        const Deadline& deadline
    );

    // Deletes every object under prefix; never fails.
    CleanupReport delete_prefix(const std::string& prefix, const Deadline& deadline);

    Deadline sweep_deadline(const Deadline& requested) const {
        return requested.or_after(std::chrono::duration_cast<std::chrono::milliseconds>(options_.operation_timeout));
    }

    std::shared_ptr<IObjectStore> store_;
    std::shared_ptr<ObjectCache> cache_;
    std::unique_ptr<registry::Registry> registry_;
    CloudStorageOptions options_;
    archive::ArchiveExtractor extractor_;
    PendingUploads pending_;
};

} // namespace storage
} // namespace lore
