#pragma once

#include "../retrieval/knowledge_retriever.hpp"
#include "../storage/storage_backend.hpp"
#include "../types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lore {
namespace service {

// ============================================================================
// Requests and Responses
// ============================================================================

/**
 * @brief A knowledge archive submitted for upload
 */
struct UploadRequest {
    std::string name;                     ///< Display name (required)
    std::string description;              ///< Display description
    std::vector<std::string> agent_ids;   ///< Target agents (at least one)
    std::string filename;                 ///< Original filename; must end in ".zip"
    std::string content_type;             ///< Content type reported by the uploader
    std::string content;                  ///< Raw archive bytes
};

struct UploadResponse {
    bool success = false;
    std::string file_id;
    ExtractionResult extraction;
};

struct CreateAgentRequest {
    std::string id;
    std::string name;
    std::string description;
    std::string tenant_id;
};

/**
 * @brief Result of a delete whose registry change succeeded
 *
 * physical_cleanup_complete is informational only.
 */
struct DeleteResponse {
    std::string file_id;
    bool physical_cleanup_complete = false;
    CleanupReport cleanup;
};

struct ServiceOptions {
    uint64_t max_upload_bytes = 50ULL * 1024 * 1024;   ///< Largest accepted archive
};

// ============================================================================
// Knowledge Service
// ============================================================================

/**
 * @brief Caller-facing knowledge management operations
 *
 * Validates requests, delegates to the storage backend and keeps the
 * retriever's cache consistent with every store and delete.
 *
 * @threadsafety Thread-safe; all state lives in the backend and retriever.
 */
class KnowledgeService {
public:
    KnowledgeService(
        std::shared_ptr<storage::IStorageBackend> backend,
        std::shared_ptr<retrieval::KnowledgeRetriever> retriever,
        ServiceOptions options = {}
    );

    /**
     * @brief Validate and store an uploaded archive
     *
     * @return Expected<UploadResponse> Stored file ID and extraction statistics,
     *         Validation for a bad request, or the backend's error
     */
    Expected<UploadResponse> upload(const UploadRequest& request);

    /**
     * @brief All files, or only those visible to agent_id when given
     */
    std::vector<KnowledgeFile> list_files(const std::optional<std::string>& agent_id = std::nullopt);

    std::vector<Agent> list_agents();

    Expected<Agent> create_agent(const CreateAgentRequest& request);

    /**
     * @brief Delete a file and invalidate the cache of every agent that saw it
     */
    Expected<DeleteResponse> delete_file(const std::string& file_id);

    /**
     * @brief Context string for an agent's prompt
     */
    Expected<std::string> get_context(const std::string& agent_id);

    /** @brief Context plus build statistics. */
    Expected<retrieval::KnowledgeContext> get_context_details(const std::string& agent_id);

    /**
     * @brief Reconcile physical storage with the registry
     */
    Expected<CleanupReport> sweep_orphans();

    const ServiceOptions& options() const {
        return options_;
    }

private:
    std::shared_ptr<storage::IStorageBackend> backend_;
    std::shared_ptr<retrieval::KnowledgeRetriever> retriever_;
    ServiceOptions options_;
};

// ============================================================================
// HTTP Mapping
// ============================================================================

/**
 * @brief HTTP status equivalent of an error code
 *
 * Caller errors map to 4xx, storage failures to 5xx, Timeout to 504.
 */
int http_status_for(ErrorCode code);

/// {"success":true,"file_id":...,"files_extracted":...,"markdown_files":...,"total_size_bytes":...}
nlohmann::json upload_response_json(const UploadResponse& response);

/// {"files":[...]}
nlohmann::json files_response_json(const std::vector<KnowledgeFile>& files);

/// {"agents":[...]}
nlohmann::json agents_response_json(const std::vector<Agent>& agents);

/// {"success":true,"file_id":...,"physical_cleanup_complete":...,"objects_deleted":...,...}
nlohmann::json delete_response_json(const DeleteResponse& response);

/// {"success":false,"error":...,"code":...}
nlohmann::json error_response_json(const Error& error);

/**
 * @brief Parse a create-agent request body
 *
 * Accepts the fields id, name, description and tenant_id; missing fields
 * are left empty for create_agent() to reject.
 */
Expected<CreateAgentRequest> create_agent_request_from_json(const std::string& body);

} // namespace service
} // namespace lore
