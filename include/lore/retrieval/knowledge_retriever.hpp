#pragma once

#include "../archive/archive_extractor.hpp"
#include "../config.hpp"
#include "../log.hpp"
#include "../storage/storage_backend.hpp"
#include "../types.hpp"

#include <cmath>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lore {
namespace retrieval {

/**
 * @brief Outcome of a context build
 *
 * Empty -> (accumulating) -> Complete | Truncated. Truncated is a valid
 * result, not an error.
 */
enum class ContextState {
    Empty,      ///< The agent has no documents
    Complete,   ///< Every document fit under the budget
    Truncated   ///< The ceiling was hit before the document list was exhausted
};

[[nodiscard]] inline const char* context_state_to_string(ContextState state) {
    switch (state) {
        case ContextState::Empty: return "empty";
        case ContextState::Complete: return "complete";
        case ContextState::Truncated: return "truncated";
    }
    return "unknown";
}

/**
 * @brief An assembled knowledge context and how it was built
 */
struct KnowledgeContext {
    std::string text;                 ///< Context string ("" when Empty)
    size_t included_documents = 0;    ///< Documents fully included
    size_t total_documents = 0;       ///< Documents available to the agent
    int estimated_tokens = 0;         ///< Estimated cost of the included pieces
    ContextState state = ContextState::Empty;
};

/**
 * @brief Builds token-budgeted knowledge contexts for agents
 *
 * Document bodies are read through the storage backend and cached per agent.
 * The cache is never invalidated automatically; callers that store or delete
 * files must call clear_agent_cache() for every affected agent.
 *
 * @threadsafety All methods are thread-safe. The cache lock is independent
 * of the registry lock and is never held while the backend is called.
 */
class KnowledgeRetriever {
public:
    /**
     * @brief Create a retriever over a storage backend
     *
     * @return Expected<std::shared_ptr<KnowledgeRetriever>> InvalidConfig when
     *         the backend is null or the budget settings are unusable
     */
    static Expected<std::shared_ptr<KnowledgeRetriever>> create(
        std::shared_ptr<storage::IStorageBackend> backend,
        RetrieverConfig config = {}
    ) {
        if (!backend) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Retriever requires a storage backend"});
        }
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        return std::shared_ptr<KnowledgeRetriever>(
            new KnowledgeRetriever(std::move(backend), std::move(config)));
    }

    /**
     * @brief Markdown bodies visible to an agent, in discovery order
     *
     * Files are taken in registry (upload) order and each file's documents in
     * sorted path order. A file that cannot be listed or a document that
     * cannot be read is logged and skipped.
     */
    Expected<std::vector<std::string>> get_knowledge_for_agent(const std::string& agent_id) {
        uint64_t generation = 0;
        {
            std::shared_lock lock(cache_mutex_);
            auto it = cache_.find(agent_id);
            if (it != cache_.end()) {
                log::logger()->trace("Knowledge cache hit agent_id={}", agent_id);
                return it->second;
            }
            generation = generation_;
        }

        std::vector<std::string> documents;
        for (const auto& file : backend_->get_knowledge_files_for_agent(agent_id)) {
            auto paths = backend_->list_documents(file);
            if (!paths) {
                log::logger()->error("Failed to list documents file_id={} error={}",
                                     file.id, paths.error().to_string());
                continue;
            }
            for (const auto& path : *paths) {
                if (!archive::is_markdown(path)) {
                    continue;
                }
                auto body = backend_->read_document(file, path);
                if (!body) {
                    log::logger()->error("Failed to read markdown file file_id={} path={} error={}",
                                         file.id, path, body.error().to_string());
                    continue;
                }
                documents.push_back(std::move(*body));
            }
        }

        // A clear that ran while the backend was read makes this snapshot stale.
        std::unique_lock lock(cache_mutex_);
        if (generation == generation_) {
            cache_[agent_id] = documents;
        } else {
            log::logger()->debug("Knowledge cache invalidated during read agent_id={}", agent_id);
        }
        return documents;
    }

    /** @brief Drop every cached agent. */
    void clear_cache() {
        std::unique_lock lock(cache_mutex_);
        cache_.clear();
        ++generation_;
    }

    /** @brief Drop one agent's cached documents. */
    void clear_agent_cache(const std::string& agent_id) {
        std::unique_lock lock(cache_mutex_);
        cache_.erase(agent_id);
        ++generation_;
    }

    /**
     * @brief Assemble the agent's documents under the token ceiling
     *
     * Layout: the header, then "## Document N\n\n<body>\n\n---\n\n" per
     * document. A document that would push the estimate over the ceiling is
     * never partially included; a note with the omitted count is appended
     * instead and assembly stops.
     */
    Expected<KnowledgeContext> build_context(const std::string& agent_id) {
        auto documents = get_knowledge_for_agent(agent_id);
        if (!documents) {
            return tl::unexpected(documents.error());
        }

        KnowledgeContext context;
        context.total_documents = documents->size();
        if (documents->empty()) {
            return context;
        }

        static const std::string footer = "\n\n---\n\n";
        std::string text = config_.header;
        int tokens = estimate_tokens(config_.header);
        context.state = ContextState::Complete;

        for (size_t i = 0; i < documents->size(); ++i) {
            const std::string& doc = (*documents)[i];
            const std::string heading = "## Document " + std::to_string(i + 1) + "\n\n";
            const int cost = estimate_tokens(heading) + estimate_tokens(doc) + estimate_tokens(footer);

            if (tokens + cost > config_.max_context_tokens) {
                const size_t omitted = documents->size() - i;
                text += "\n\n*Note: " + std::to_string(omitted) +
                        " additional documents were omitted due to token limits.*\n";
                context.state = ContextState::Truncated;
                log::logger()->warn("Knowledge context truncated due to token limit agent_id={} "
                                    "included_docs={} total_docs={} estimated_tokens={}",
                                    agent_id, i, documents->size(), tokens);
                break;
            }

            text += heading;
            text += doc;
            text += footer;
            tokens += cost;
            ++context.included_documents;
        }

        context.text = std::move(text);
        context.estimated_tokens = tokens;
        log::logger()->info("Knowledge context prepared agent_id={} docs_count={} estimated_tokens={} estimated_chars={}",
                            agent_id, documents->size(), tokens, context.text.size());
        return context;
    }

    /**
     * @brief Context string for an agent ("" when it has no documents)
     */
    Expected<std::string> get_knowledge_context(const std::string& agent_id) {
        auto context = build_context(agent_id);
        if (!context) {
            return tl::unexpected(context.error());
        }
        return std::move(context->text);
    }

    const RetrieverConfig& config() const {
        return config_;
    }

private:
    KnowledgeRetriever(std::shared_ptr<storage::IStorageBackend> backend, RetrieverConfig config)
        : backend_(std::move(backend))
        , config_(std::move(config))
    {}

    int estimate_tokens(const std::string& text) const {
        return static_cast<int>(std::lround(static_cast<double>(text.size()) * config_.tokens_per_char));
    }

    std::shared_ptr<storage::IStorageBackend> backend_;
    RetrieverConfig config_;

    std::unordered_map<std::string, std::vector<std::string>> cache_;
    uint64_t generation_ = 0;   ///< Bumped by every clear
    mutable std::shared_mutex cache_mutex_;
};

} // namespace retrieval
} // namespace lore
