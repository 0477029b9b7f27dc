#include "lore/service/knowledge_service.hpp"
#include "lore/log.hpp"

#include <filesystem>

namespace lore {
namespace service {

KnowledgeService::KnowledgeService(
    std::shared_ptr<storage::IStorageBackend> backend,
    std::shared_ptr<retrieval::KnowledgeRetriever> retriever,
    ServiceOptions options
)
    : backend_(std::move(backend))
    , retriever_(std::move(retriever))
    , options_(options)
{}

Expected<UploadResponse> KnowledgeService::upload(const UploadRequest& request) {
    if (request.name.empty()) {
        return tl::unexpected(Error{ErrorCode::Validation, "Name is required"});
    }
    if (request.agent_ids.empty()) {
        return tl::unexpected(Error{ErrorCode::Validation, "At least one agent ID is required"});
    }
    if (std::filesystem::path(request.filename).extension() != ".zip") {
        return tl::unexpected(Error{ErrorCode::Validation, "Only .zip files are allowed", request.filename});
    }
    if (request.content.empty()) {
        return tl::unexpected(Error{ErrorCode::Validation, "Uploaded file is empty", request.filename});
    }
    if (request.content.size() > options_.max_upload_bytes) {
        return tl::unexpected(Error{
            ErrorCode::Validation,
            "Request too large",
            std::to_string(request.content.size()) + " > " + std::to_string(options_.max_upload_bytes)
        });
    }

    auto stored = backend_->store_knowledge_file(
        request.name,
        request.description,
        request.agent_ids,
        request.content,
        request.content_type
    );
    if (!stored) {
        log::logger()->error("Failed to store knowledge file name={} error={}",
                             request.name, stored.error().to_string());
        return tl::unexpected(stored.error());
    }

    for (const auto& agent_id : request.agent_ids) {
        retriever_->clear_agent_cache(agent_id);
    }

    UploadResponse response;
    response.success = true;
    response.file_id = stored->file.id;
    response.extraction = stored->extraction;
    return response;
}

std::vector<KnowledgeFile> KnowledgeService::list_files(const std::optional<std::string>& agent_id) {
    if (agent_id.has_value() && !agent_id->empty()) {
        return backend_->get_knowledge_files_for_agent(*agent_id);
    }
    return backend_->get_all_knowledge_files();
}

std::vector<Agent> KnowledgeService::list_agents() {
    return backend_->get_all_agents();
}

Expected<Agent> KnowledgeService::create_agent(const CreateAgentRequest& request) {
    if (request.id.empty() || request.name.empty() || request.tenant_id.empty()) {
        return tl::unexpected(Error{ErrorCode::Validation, "ID, name, and tenant ID are required"});
    }

    auto created = backend_->create_agent(request.id, request.name, request.description, request.tenant_id);
    if (!created) {
        log::logger()->error("Failed to create agent id={} error={}", request.id, created.error().to_string());
        return tl::unexpected(created.error());
    }
    log::logger()->info("Created agent id={} tenant_id={}", created->id, created->tenant_id);
    return created;
}

Expected<DeleteResponse> KnowledgeService::delete_file(const std::string& file_id) {
    if (file_id.empty()) {
        return tl::unexpected(Error{ErrorCode::Validation, "File ID is required"});
    }

    auto file = backend_->get_knowledge_file(file_id);
    if (!file) {
        return tl::unexpected(file.error());
    }

    auto cleanup = backend_->delete_knowledge_file(file_id);
    if (!cleanup) {
        return tl::unexpected(cleanup.error());
    }

    for (const auto& agent_id : file->agent_ids) {
        retriever_->clear_agent_cache(agent_id);
    }

    DeleteResponse response;
    response.file_id = file_id;
    response.cleanup = *cleanup;
    response.physical_cleanup_complete = cleanup->complete();
    return response;
}

Expected<std::string> KnowledgeService::get_context(const std::string& agent_id) {
    return retriever_->get_knowledge_context(agent_id);
}

Expected<retrieval::KnowledgeContext> KnowledgeService::get_context_details(const std::string& agent_id) {
    return retriever_->build_context(agent_id);
}

Expected<CleanupReport> KnowledgeService::sweep_orphans() {
    return backend_->sweep_orphans();
}

// ============================================================================
// HTTP Mapping
// ============================================================================

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation:
        case ErrorCode::InvalidArchiveEntry:
        case ErrorCode::ArchiveReadFailed:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::AlreadyExists:
            return 409;
        case ErrorCode::Timeout:
            return 504;
        case ErrorCode::InvalidConfig:
        case ErrorCode::StorageWriteFailed:
        case ErrorCode::StorageReadFailed:
        case ErrorCode::RegistryPersistFailed:
        case ErrorCode::RegistryCorrupt:
        case ErrorCode::Unknown:
            return 500;
    }
    return 500;
}

nlohmann::json upload_response_json(const UploadResponse& response) {
    return nlohmann::json{
        {"success", response.success},
        {"file_id", response.file_id},
        {"files_extracted", response.extraction.files_extracted},
        {"markdown_files", response.extraction.markdown_files},
        {"total_size_bytes", response.extraction.total_size_bytes}
    };
}

nlohmann::json files_response_json(const std::vector<KnowledgeFile>& files) {
    return nlohmann::json{{"files", files}};
}

nlohmann::json agents_response_json(const std::vector<Agent>& agents) {
    return nlohmann::json{{"agents", agents}};
}

nlohmann::json delete_response_json(const DeleteResponse& response) {
    return nlohmann::json{
        {"success", true},
        {"file_id", response.file_id},
        {"physical_cleanup_complete", response.physical_cleanup_complete},
        {"objects_deleted", response.cleanup.objects_deleted},
        {"objects_failed", response.cleanup.objects_failed},
        {"timed_out", response.cleanup.timed_out}
    };
}

nlohmann::json error_response_json(const Error& error) {
    return nlohmann::json{
        {"success", false},
        {"error", error.message},
        {"code", error_code_to_string(error.code)}
    };
}

Expected<CreateAgentRequest> create_agent_request_from_json(const std::string& body) {
    try {
        const auto j = nlohmann::json::parse(body);
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::Validation, "Invalid request body"});
        }
        CreateAgentRequest request;
        request.id = j.value("id", "");
        request.name = j.value("name", "");
        request.description = j.value("description", "");
        request.tenant_id = j.value("tenant_id", "");
        return request;
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::Validation, "Invalid request body", std::string(e.what())});
    }
}

} // namespace service
} // namespace lore
