#pragma once

#include "../config.hpp"
#include "../log.hpp"
#include "../types.hpp"
#include "../util/uuid.hpp"
#include "registry_store.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lore {
namespace registry {

/**
 * @brief In-memory agent and knowledge-file registry with write-through persistence
 *
 * The registry is the single source of truth for which agents exist and
 * which knowledge files each agent can see. Every mutation is applied to the
 * in-memory document under an exclusive lock and the whole document is
 * written to the IRegistryStore before the lock is released. When the write
 * fails the mutation is undone, so memory never runs ahead of durable state.
 *
 * @threadsafety All public methods are thread-safe. Read operations use shared
 * locks; mutations use exclusive locks held across serialize-and-persist.
 */
class Registry {
public:
    /**
     * @brief Load the registry, seeding a default agent on first start
     *
     * @param store Durable sink for the registry document
     * @param default_agent Agent created when no registry has been persisted
     * @return Expected<std::unique_ptr<Registry>> Loaded registry, RegistryCorrupt
     *         when the document cannot be parsed, or the store's error
     */
    static Expected<std::unique_ptr<Registry>> open(
        std::shared_ptr<IRegistryStore> store,
        const DefaultAgentConfig& default_agent = {}
    ) {
        if (!store) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Registry store cannot be null"});
        }

        auto registry = std::unique_ptr<Registry>(new Registry(store));

        auto loaded = store->load();
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }

        if (loaded->has_value()) {
            try {
                registry->doc_ = nlohmann::json::parse(**loaded).get<RegistryDocument>();
            } catch (const std::exception& e) {
                return tl::unexpected(Error{
                    ErrorCode::RegistryCorrupt,
                    std::string("Failed to parse registry: ") + e.what(),
                    store->location()
                });
            }
            log::logger()->info("Registry loaded location={} agents={} files={}",
                                store->location(), registry->doc_.agents.size(),
                                registry->doc_.knowledge_files.size());
            return registry;
        }

        log::logger()->info("Registry does not exist, creating default registry location={}",
                            store->location());
        Agent seed;
        seed.id = default_agent.id;
        seed.name = default_agent.name;
        seed.description = default_agent.description;
        seed.tenant_id = default_agent.tenant_id;
        seed.created_at = detail::now_micros();
        registry->doc_.agents.push_back(std::move(seed));

        std::unique_lock lock(registry->mutex_);
        if (auto saved = registry->persist_locked(); !saved) {
            return tl::unexpected(saved.error());
        }
        lock.unlock();
        return registry;
    }

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ------------------------------------------------------------------------
    // Agents
    // ------------------------------------------------------------------------

    /**
     * @brief Create an agent with a freshly generated API key
     *
     * @return Expected<Agent> Created agent with the key stripped, or
     *         AlreadyExists / RegistryPersistFailed
     */
    Expected<Agent> create_agent(
        const std::string& id,
        const std::string& name,
        const std::string& description,
        const std::string& tenant_id
    ) {
        auto api_key = util::generate_uuid();
        if (!api_key) {
            return tl::unexpected(api_key.error());
        }

        std::unique_lock lock(mutex_);
        if (find_agent_locked(id) != nullptr) {
            return tl::unexpected(Error{
                ErrorCode::AlreadyExists,
                "agent with ID " + id + " already exists"
            });
        }

        Agent agent;
        agent.id = id;
        agent.name = name;
        agent.description = description;
        agent.tenant_id = tenant_id;
        agent.api_key = std::move(*api_key);
        agent.created_at = detail::now_micros();
        doc_.agents.push_back(agent);

        if (auto saved = persist_locked(); !saved) {
            doc_.agents.pop_back();
            return tl::unexpected(saved.error());
        }
        return agent.redacted();
    }

    /** @brief All agents in creation order, API keys stripped. */
    std::vector<Agent> agents() const {
        std::shared_lock lock(mutex_);
        std::vector<Agent> result;
        result.reserve(doc_.agents.size());
        for (const auto& agent : doc_.agents) {
            result.push_back(agent.redacted());
        }
        return result;
    }

    /** @brief Look up one agent, API key stripped. */
    std::optional<Agent> find_agent(const std::string& id) const {
        std::shared_lock lock(mutex_);
        const Agent* agent = find_agent_locked(id);
        if (agent == nullptr) {
            return std::nullopt;
        }
        return agent->redacted();
    }

    /**
     * @brief Check that a file's target agents are non-empty and all exist
     */
    Expected<void> validate_agent_ids(const std::vector<std::string>& agent_ids) const {
        std::shared_lock lock(mutex_);
        return validate_agent_ids_locked(agent_ids);
    }

    // ------------------------------------------------------------------------
    // Knowledge files
    // ------------------------------------------------------------------------

    /**
     * @brief Append a knowledge file record and persist
     *
     * @return Expected<void> Validation for missing/unknown agents or a
     *         duplicate file ID, RegistryPersistFailed when the write fails
     */
    Expected<void> add_file(const KnowledgeFile& file) {
        std::unique_lock lock(mutex_);
        if (auto valid = validate_agent_ids_locked(file.agent_ids); !valid) {
            return valid;
        }
        if (find_file_index_locked(file.id).has_value()) {
            return tl::unexpected(Error{
                ErrorCode::AlreadyExists,
                "knowledge file already registered: " + file.id
            });
        }

        doc_.knowledge_files.push_back(file);
        if (auto saved = persist_locked(); !saved) {
            doc_.knowledge_files.pop_back();
            return tl::unexpected(saved.error());
        }
        return {};
    }

    /**
     * @brief Remove a knowledge file record and persist
     *
     * @return Expected<KnowledgeFile> The removed record, NotFound, or
     *         RegistryPersistFailed (in which case the record is kept)
     */
    Expected<KnowledgeFile> remove_file(const std::string& id) {
        std::unique_lock lock(mutex_);
        const auto index = find_file_index_locked(id);
        if (!index) {
            return tl::unexpected(Error{ErrorCode::NotFound, "knowledge file not found: " + id});
        }

        const auto position = doc_.knowledge_files.begin() + static_cast<std::ptrdiff_t>(*index);
        KnowledgeFile removed = *position;
        doc_.knowledge_files.erase(position);

        if (auto saved = persist_locked(); !saved) {
            doc_.knowledge_files.insert(
                doc_.knowledge_files.begin() + static_cast<std::ptrdiff_t>(*index), removed);
            return tl::unexpected(saved.error());
        }
        return removed;
    }

    Expected<KnowledgeFile> find_file(const std::string& id) const {
        std::shared_lock lock(mutex_);
        const auto index = find_file_index_locked(id);
        if (!index) {
            return tl::unexpected(Error{ErrorCode::NotFound, "knowledge file not found: " + id});
        }
        return doc_.knowledge_files[*index];
    }

    /** @brief Copy of every knowledge file in upload order. */
    std::vector<KnowledgeFile> files() const {
        std::shared_lock lock(mutex_);
        return doc_.knowledge_files;
    }

    /** @brief Files visible to an agent, in upload order. */
    std::vector<KnowledgeFile> files_for_agent(const std::string& agent_id) const {
        std::shared_lock lock(mutex_);
        std::vector<KnowledgeFile> result;
        for (const auto& file : doc_.knowledge_files) {
            if (file.visible_to(agent_id)) {
                result.push_back(file);
            }
        }
        return result;
    }

    /** @brief IDs of all registered files (used by orphan sweeps). */
    std::vector<std::string> file_ids() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(doc_.knowledge_files.size());
        for (const auto& file : doc_.knowledge_files) {
            ids.push_back(file.id);
        }
        return ids;
    }

    /** @brief Full copy of the document, API keys included. */
    RegistryDocument snapshot() const {
        std::shared_lock lock(mutex_);
        return doc_;
    }

private:
    explicit Registry(std::shared_ptr<IRegistryStore> store)
        : store_(std::move(store))
    {}

    // Caller holds mutex_ exclusively.
    Expected<void> persist_locked() {
        std::string serialized;
        try {
            serialized = nlohmann::json(doc_).dump(2);
        } catch (const std::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::RegistryPersistFailed,
                std::string("Failed to marshal registry: ") + e.what(),
                store_->location()
            });
        }

        auto saved = store_->save(serialized);
        if (!saved) {
            log::logger()->error("Failed to save registry location={} error={}",
                                 store_->location(), saved.error().to_string());
            return tl::unexpected(Error{
                ErrorCode::RegistryPersistFailed,
                "Failed to save registry: " + saved.error().message,
                store_->location()
            });
        }
        log::logger()->debug("Registry saved location={} agents={} files={}",
                             store_->location(), doc_.agents.size(), doc_.knowledge_files.size());
        return {};
    }

    const Agent* find_agent_locked(const std::string& id) const {
        for (const auto& agent : doc_.agents) {
            if (agent.id == id) {
                return &agent;
            }
        }
        return nullptr;
    }

    std::optional<size_t> find_file_index_locked(const std::string& id) const {
        for (size_t i = 0; i < doc_.knowledge_files.size(); ++i) {
            if (doc_.knowledge_files[i].id == id) {
                return i;
            }
        }
        return std::nullopt;
    }

    Expected<void> validate_agent_ids_locked(const std::vector<std::string>& agent_ids) const {
        if (agent_ids.empty()) {
            return tl::unexpected(Error{ErrorCode::Validation, "At least one agent ID is required"});
        }
        for (const auto& agent_id : agent_ids) {
            if (find_agent_locked(agent_id) == nullptr) {
                return tl::unexpected(Error{ErrorCode::Validation, "Unknown agent ID", agent_id});
            }
        }
        return {};
    }

    std::shared_ptr<IRegistryStore> store_;
    RegistryDocument doc_;
    mutable std::shared_mutex mutex_;
};

} // namespace registry
} // namespace lore
