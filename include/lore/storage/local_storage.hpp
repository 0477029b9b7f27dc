#pragma once

#include "../archive/archive_extractor.hpp"
#include "../registry/registry.hpp"
#include "pending_uploads.hpp"
#include "storage_backend.hpp"
#include <filesystem>
#include <memory>

namespace lore {
namespace storage {

/**
 * @brief Storage backend on the local filesystem
 *
 * Layout under the base directory:
 * - registry.json
 * - files/<file_id>/content.zip
 * - files/<file_id>/extracted/...
 *
 * A KnowledgeFile's file_path is its files/<file_id> directory.
 */
class LocalStorageBackend : public IStorageBackend {
public:
    /**
     * @brief Open (or initialize) a knowledge base rooted at base_path
     *
     * Creates base_path and base_path/files, then loads or seeds the registry.
     */
    static Expected<std::unique_ptr<LocalStorageBackend>> open(
        const std::filesystem::path& base_path,
        const DefaultAgentConfig& default_agent = {}
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
        return "local";
    }

    const std::filesystem::path& base_path() const {
        return base_path_;
    }

private:
    LocalStorageBackend(std::filesystem::path base_path, std::unique_ptr<registry::Registry> registry)
        : base_path_(std::move(base_path))
        , registry_(std::move(registry))
    {}

    std::filesystem::path files_root() const {
        return base_path_ / "files";
    }

    // Removes a file directory, counting entries; never fails.
    CleanupReport remove_file_dir(const std::filesystem::path& dir) const;

    std::filesystem::path base_path_;
    std::unique_ptr<registry::Registry> registry_;
    archive::ArchiveExtractor extractor_;
    PendingUploads pending_;
};

} // namespace storage
} // namespace lore
