#pragma once

#include "../config.hpp"
#include "../types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lore {
namespace storage {

/**
 * @brief Abstract interface for knowledge-base storage implementations
 *
 * Persists uploaded archives, their extracted documents and the shared
 * registry. Local disk and cloud object storage satisfy the same contract,
 * so callers never branch on the implementation.
 *
 * Design principles:
 * - Thread-safe: any number of callers may invoke any method concurrently
 * - Synchronous: every operation blocks until complete or its Deadline passes
 * - Registry-first reads: metadata queries never touch physical storage
 */
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    /**
     * @brief Store an archive, extract it and register the resulting file
     *
     * The archive and its extracted documents are written first; the
     * registry entry is added and persisted last. When extraction or the
     * registry write fails nothing is registered and the file's physical
     * prefix is removed best-effort.
     *
     * @param name Display name
     * @param description Display description
     * @param agent_ids Agents the file is visible to (non-empty, all must exist)
     * @param content Raw ZIP bytes
     * @param content_type Content type reported by the uploader
     * @param deadline Optional budget for the whole operation
     * @return Expected<UploadResult> Stored record plus extraction statistics
     */
    virtual Expected<UploadResult> store_knowledge_file(
        const std::string& name,
        const std::string& description,
        const std::vector<std::string>& agent_ids,
        const std::string& content,
        const std::string& content_type,
        const Deadline& deadline = Deadline::none()
    ) = 0;

    /**
     * @brief Look up one knowledge file by ID
     *
     * @return Expected<KnowledgeFile> Record or ErrorCode::NotFound
     */
    virtual Expected<KnowledgeFile> get_knowledge_file(const std::string& file_id) = 0;

    /**
     * @brief Files visible to an agent, in upload order
     */
    virtual std::vector<KnowledgeFile> get_knowledge_files_for_agent(const std::string& agent_id) = 0;

    /**
     * @brief Every registered file, in upload order
     */
    virtual std::vector<KnowledgeFile> get_all_knowledge_files() = 0;

    /**
     * @brief Remove a file from the registry, then delete its physical objects
     *
     * The registry change is the success signal. Physical cleanup is
     * best-effort: failures are logged and counted in the returned report,
     * never returned as the error.
     *
     * @param file_id File to delete
     * @param deadline Budget for the physical sweep; backends apply their
     *        configured default when unbounded
     * @return Expected<CleanupReport> Cleanup statistics, NotFound, or the
     *         registry persist error
     */
    virtual Expected<CleanupReport> delete_knowledge_file(
        const std::string& file_id,
        const Deadline& deadline = Deadline::none()
    ) = 0;

    /**
     * @brief All agents in creation order, API keys stripped
     */
    virtual std::vector<Agent> get_all_agents() = 0;

    /**
     * @brief One agent, API key stripped
     */
    virtual std::optional<Agent> get_agent(const std::string& agent_id) = 0;

    /**
     * @brief Register a new agent with a generated API key
     *
     * @return Expected<Agent> Created agent (key stripped) or AlreadyExists
     */
    virtual Expected<Agent> create_agent(
        const std::string& id,
        const std::string& name,
        const std::string& description,
        const std::string& tenant_id
    ) = 0;

    /**
     * @brief Relative paths of a file's extracted documents, sorted
     */
    virtual Expected<std::vector<std::string>> list_documents(
        const KnowledgeFile& file,
        const Deadline& deadline = Deadline::none()
    ) = 0;

    /**
     * @brief Body of one extracted document
     *
     * @param file Owning knowledge file
     * @param relative_path Path as returned by list_documents()
     */
    virtual Expected<std::string> read_document(
        const KnowledgeFile& file,
        const std::string& relative_path,
        const Deadline& deadline = Deadline::none()
    ) = 0;

    /**
     * @brief Delete physical file prefixes no registry entry references
     */
    virtual Expected<CleanupReport> sweep_orphans(const Deadline& deadline = Deadline::none()) = 0;

    /** @brief "local" or "cloud". */
    virtual std::string backend_name() const = 0;
};

/**
 * @brief Factory function for creating storage backends
 *
 * Validates the configuration and builds the implementation it selects.
 * For testing, inject a MockStorageBackend or a cloud backend over
 * MockObjectStore directly.
 *
 * @param config Storage configuration
 * @return Expected<std::unique_ptr<IStorageBackend>> Backend or construction error
 */
Expected<std::unique_ptr<IStorageBackend>> create_storage_backend(const StorageConfig& config);

namespace detail {

/// Content type for an extracted document uploaded to object storage.
std::string content_type_for(const std::string& relative_path);

} // namespace detail

} // namespace storage
} // namespace lore
