/**
 * Lore Knowledge Base Admin
 *
 * Command-line front end for the knowledge management operations. Storage is
 * configured from the environment (STORAGE_TYPE, LOCAL_STORAGE_PATH,
 * GCP_STORAGE_BUCKET, ...).
 *
 * Usage:
 *   ./kb_admin <command> [arguments]
 *
 * Commands:
 *   agents                                       List agents
 *   create-agent <id> <name> <tenant> [desc]     Create an agent
 *   files [agent_id]                             List knowledge files
 *   upload <zip> <name> <agent_id>... [--description <text>]
 *                                                Upload an archive
 *   delete <file_id>                             Delete a knowledge file
 *   context <agent_id>                           Print an agent's context
 *   sweep                                        Remove orphaned storage
 */

#include "lore/lore.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Lore Knowledge Base Admin\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <command> [arguments]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  agents                                       List agents\n";
    std::cout << "  create-agent <id> <name> <tenant> [desc]     Create an agent\n";
    std::cout << "  files [agent_id]                             List knowledge files\n";
    std::cout << "  upload <zip> <name> <agent_id>... [--description <text>]\n";
    std::cout << "                                               Upload an archive\n";
    std::cout << "  delete <file_id>                             Delete a knowledge file\n";
    std::cout << "  context <agent_id>                           Print an agent's context\n";
    std::cout << "  sweep                                        Remove orphaned storage\n\n";
    std::cout << "Environment:\n";
    std::cout << "  STORAGE_TYPE=local|gcp, LOCAL_STORAGE_PATH, GCP_STORAGE_BUCKET,\n";
    std::cout << "  GCP_PROJECT_ID, GCP_KEY_FILE, STORAGE_EMULATOR_HOST, KNOWLEDGE_CACHE_DIR,\n";
    std::cout << "  KNOWLEDGE_CACHE_TTL_SECONDS, KNOWLEDGE_OPERATION_TIMEOUT_SECONDS, LOG_LEVEL\n";
}

int fail(const lore::Error& error) {
    std::cerr << lore::service::error_response_json(error).dump(2) << std::endl;
    return 1;
}

bool read_binary(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return !in.bad();
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "--help") {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    if (const char* level = std::getenv("LOG_LEVEL")) {
        lore::log::set_level(std::string(level));
    }

    auto config = lore::StorageConfig::from_env();
    if (!config) {
        return fail(config.error());
    }

    auto backend = lore::storage::create_storage_backend(*config);
    if (!backend) {
        return fail(backend.error());
    }

    std::shared_ptr<lore::storage::IStorageBackend> storage = std::move(*backend);
    auto retriever = lore::retrieval::KnowledgeRetriever::create(storage);
    if (!retriever) {
        return fail(retriever.error());
    }
    lore::service::KnowledgeService service(storage, *retriever);

    const std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "agents") {
        std::cout << lore::service::agents_response_json(service.list_agents()).dump(2) << std::endl;
        return 0;
    }

    if (command == "create-agent") {
        if (args.size() < 3) {
            print_usage(argv[0]);
            return 1;
        }
        lore::service::CreateAgentRequest request;
        request.id = args[0];
        request.name = args[1];
        request.tenant_id = args[2];
        request.description = args.size() > 3 ? args[3] : "";
        auto agent = service.create_agent(request);
        if (!agent) {
            return fail(agent.error());
        }
        std::cout << nlohmann::json(*agent).dump(2) << std::endl;
        return 0;
    }

    if (command == "files") {
        std::optional<std::string> agent_id;
        if (!args.empty()) {
            agent_id = args[0];
        }
        std::cout << lore::service::files_response_json(service.list_files(agent_id)).dump(2) << std::endl;
        return 0;
    }

    if (command == "upload") {
        lore::service::UploadRequest request;
        std::vector<std::string> positional;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--description" && i + 1 < args.size()) {
                request.description = args[++i];
            } else {
                positional.push_back(args[i]);
            }
        }
        if (positional.size() < 3) {
            print_usage(argv[0]);
            return 1;
        }

        request.filename = positional[0];
        request.name = positional[1];
        request.agent_ids.assign(positional.begin() + 2, positional.end());
        request.content_type = "application/zip";
        if (!read_binary(request.filename, request.content)) {
            return fail(lore::Error{lore::ErrorCode::StorageReadFailed, "Failed to read archive", request.filename});
        }

        auto response = service.upload(request);
        if (!response) {
            return fail(response.error());
        }
        std::cout << lore::service::upload_response_json(*response).dump(2) << std::endl;
        return 0;
    }

    if (command == "delete") {
        if (args.empty()) {
            print_usage(argv[0]);
            return 1;
        }
        auto response = service.delete_file(args[0]);
        if (!response) {
            return fail(response.error());
        }
        std::cout << lore::service::delete_response_json(*response).dump(2) << std::endl;
        return 0;
    }

    if (command == "context") {
        if (args.empty()) {
            print_usage(argv[0]);
            return 1;
        }
        auto context = service.get_context_details(args[0]);
        if (!context) {
            return fail(context.error());
        }
        std::cout << context->text;
        std::cerr << "[" << lore::retrieval::context_state_to_string(context->state) << "] "
                  << context->included_documents << "/" << context->total_documents
                  << " documents, ~" << context->estimated_tokens << " tokens" << std::endl;
        return 0;
    }

    if (command == "sweep") {
        auto report = service.sweep_orphans();
        if (!report) {
            return fail(report.error());
        }
        std::cout << nlohmann::json(*report).dump(2) << std::endl;
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
