#pragma once

/**
 * @file lore.hpp
 * @brief Main convenience header for the Lore knowledge engine
 *
 * Include this single header to get access to all public Lore APIs.
 *
 * Lore stores per-agent knowledge bases (uploaded ZIP archives of markdown
 * documents) on local disk or in cloud object storage, and assembles
 * token-budgeted context strings for an agent's prompt.
 *
 * Quick Start:
 * @code
 * #include <lore/lore.hpp>
 *
 * int main() {
 *     auto config = lore::StorageConfig::from_env();
 *     if (!config) {
 *         std::cerr << "Error: " << config.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto backend = lore::storage::create_storage_backend(*config);
 *     if (!backend) {
 *         std::cerr << "Error: " << backend.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     std::shared_ptr<lore::storage::IStorageBackend> shared = std::move(*backend);
 *     auto retriever = lore::retrieval::KnowledgeRetriever::create(shared);
 *     if (!retriever) {
 *         std::cerr << "Error: " << retriever.error().to_string() << std::endl;
 *         return 1;
 *     }
 *     lore::service::KnowledgeService service(shared, *retriever);
 *
 *     auto context = service.get_context("default");
 *     if (context) {
 *         std::cout << *context << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - lore::storage::IStorageBackend: local and cloud storage behind one contract
 * - lore::registry::Registry: agents and knowledge files, persisted on every change
 * - lore::retrieval::KnowledgeRetriever: cached, budgeted context assembly
 * - lore::service::KnowledgeService: validated management operations
 * - lore::Error: Structured error handling
 *
 * Thread Safety:
 * - Every public component may be shared across request-handler threads
 * - All storage operations are synchronous
 */

// Core types
#include "types.hpp"
#include "config.hpp"
#include "log.hpp"

// Storage
#include "archive/archive_extractor.hpp"
#include "registry/registry.hpp"
#include "storage/storage_backend.hpp"
#include "storage/local_storage.hpp"
#include "storage/cloud_storage.hpp"

// Retrieval and management
#include "retrieval/knowledge_retriever.hpp"
#include "service/knowledge_service.hpp"

/**
 * @namespace lore
 * @brief Main namespace for the Lore library
 *
 * Components live in nested namespaces:
 * - lore::archive - ZIP extraction
 * - lore::registry - Agent and file registry
 * - lore::storage - Storage backends, object store client and cache
 * - lore::retrieval - Context assembly
 * - lore::service - Management operations
 */
