#include "lore/storage/local_storage.hpp"
#include "lore/log.hpp"
#include "lore/util/uuid.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>

namespace lore {
namespace storage {

Expected<std::unique_ptr<LocalStorageBackend>> LocalStorageBackend::open(
    const std::filesystem::path& base_path,
    const DefaultAgentConfig& default_agent
) {
    if (base_path.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Local storage path cannot be empty"});
    }

    std::error_code ec;
    std::filesystem::create_directories(base_path / "files", ec);
    if (ec) {
        return tl::unexpected(Error{
            ErrorCode::StorageWriteFailed,
            "Failed to create storage directory: " + ec.message(),
            base_path.string()
        });
    }

    auto store = std::make_shared<registry::FileRegistryStore>(base_path / "registry.json");
    auto reg = registry::Registry::open(store, default_agent);
    if (!reg) {
        return tl::unexpected(reg.error());
    }

    log::logger()->info("Local storage ready base={}", base_path.string());
    return std::unique_ptr<LocalStorageBackend>(
        new LocalStorageBackend(base_path, std::move(*reg)));
}

Expected<UploadResult> LocalStorageBackend::store_knowledge_file(
    const std::string& name,
    const std::string& description,
    const std::vector<std::string>& agent_ids,
    const std::string& content,
    const std::string& content_type,
    const Deadline& deadline
) {
    if (auto valid = registry_->validate_agent_ids(agent_ids); !valid) {
        return tl::unexpected(valid.error());
    }
    if (auto ok = deadline.check("store_knowledge_file"); !ok) {
        return tl::unexpected(ok.error());
    }

    auto file_id = util::generate_uuid();
    if (!file_id) {
        return tl::unexpected(file_id.error());
    }

    const auto file_dir = files_root() / *file_id;
    const auto archive_path = file_dir / "content.zip";
    PendingUploads::Guard pending(pending_, *file_id);

    std::error_code ec;
    std::filesystem::create_directories(file_dir, ec);
    if (ec) {
        return tl::unexpected(Error{
            ErrorCode::StorageWriteFailed,
            "Failed to create file directory: " + ec.message(),
            file_dir.string()
        });
    }

    {
        std::ofstream out(archive_path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            remove_file_dir(file_dir);
            return tl::unexpected(Error{
                ErrorCode::StorageWriteFailed,
                "Failed to write archive",
                archive_path.string()
            });
        }
    }

    ExtractionResult extraction = extractor_.extract_file(archive_path, file_dir / "extracted");
    if (!extraction.success) {
        remove_file_dir(file_dir);
        Error err = extraction.error.value_or(Error{ErrorCode::ArchiveReadFailed, "Extraction failed"});
        log::logger()->warn("Extraction failed file_id={} error={}", *file_id, err.to_string());
        return tl::unexpected(err);
    }

    if (auto ok = deadline.check("store_knowledge_file"); !ok) {
        remove_file_dir(file_dir);
        return tl::unexpected(ok.error());
    }

    KnowledgeFile file;
    file.id = *file_id;
    file.name = name;
    file.description = description;
    file.file_path = file_dir.string();
    file.agent_ids = agent_ids;
    file.uploaded_at = lore::detail::now_micros();
    file.file_size = static_cast<int64_t>(content.size());
    file.content_type = content_type;

    if (auto added = registry_->add_file(file); !added) {
        remove_file_dir(file_dir);
        return tl::unexpected(added.error());
    }

    log::logger()->info("Stored knowledge file id={} name={} files={} markdown={}",
                        file.id, file.name, extraction.files_extracted, extraction.markdown_files);
    return UploadResult{std::move(file), extraction};
}

Expected<KnowledgeFile> LocalStorageBackend::get_knowledge_file(const std::string& file_id) {
    return registry_->find_file(file_id);
}

std::vector<KnowledgeFile> LocalStorageBackend::get_knowledge_files_for_agent(const std::string& agent_id) {
    return registry_->files_for_agent(agent_id);
}

std::vector<KnowledgeFile> LocalStorageBackend::get_all_knowledge_files() {
    return registry_->files();
}

Expected<CleanupReport> LocalStorageBackend::delete_knowledge_file(
    const std::string& file_id,
    const Deadline& deadline
) {
    if (auto ok = deadline.check("delete_knowledge_file"); !ok) {
        return tl::unexpected(ok.error());
    }

    auto removed = registry_->remove_file(file_id);
    if (!removed) {
        return tl::unexpected(removed.error());
    }

    CleanupReport report = remove_file_dir(removed->file_path);
    log::logger()->info("Deleted knowledge file id={} entries_removed={}", file_id, report.objects_deleted);
    return report;
}

std::vector<Agent> LocalStorageBackend::get_all_agents() {
    return registry_->agents();
}

std::optional<Agent> LocalStorageBackend::get_agent(const std::string& agent_id) {
    return registry_->find_agent(agent_id);
}

Expected<Agent> LocalStorageBackend::create_agent(
    const std::string& id,
    const std::string& name,
    const std::string& description,
    const std::string& tenant_id
) {
    return registry_->create_agent(id, name, description, tenant_id);
}

Expected<std::vector<std::string>> LocalStorageBackend::list_documents(
    const KnowledgeFile& file,
    const Deadline& deadline
) {
    if (auto ok = deadline.check("list_documents"); !ok) {
        return tl::unexpected(ok.error());
    }

    const std::filesystem::path root = std::filesystem::path(file.file_path) / "extracted";
    std::vector<std::string> documents;

    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        return tl::unexpected(Error{
            ErrorCode::StorageReadFailed,
            "Extracted directory missing",
            root.string()
        });
    }

    std::filesystem::recursive_directory_iterator it(root, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            documents.push_back(it->path().lexically_relative(root).generic_string());
        }
    }
    if (ec) {
        return tl::unexpected(Error{
            ErrorCode::StorageReadFailed,
            "Failed to walk extracted directory: " + ec.message(),
            root.string()
        });
    }

    std::sort(documents.begin(), documents.end());
    return documents;
}

Expected<std::string> LocalStorageBackend::read_document(
    const KnowledgeFile& file,
    const std::string& relative_path,
    const Deadline& deadline
) {
    if (auto ok = deadline.check("read_document"); !ok) {
        return tl::unexpected(ok.error());
    }

    auto path = archive::resolve_entry_path(std::filesystem::path(file.file_path) / "extracted", relative_path);
    if (!path) {
        return tl::unexpected(path.error());
    }

    std::ifstream in(*path, std::ios::binary);
    if (!in.is_open()) {
        return tl::unexpected(Error{ErrorCode::StorageReadFailed, "Failed to open document", path->string()});
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return tl::unexpected(Error{ErrorCode::StorageReadFailed, "Failed to read document", path->string()});
    }
    return buffer.str();
}

Expected<CleanupReport> LocalStorageBackend::sweep_orphans(const Deadline& deadline) {
    std::error_code ec;
    std::filesystem::directory_iterator it(files_root(), ec);
    if (ec) {
        return tl::unexpected(Error{
            ErrorCode::StorageReadFailed,
            "Failed to list files directory: " + ec.message(),
            files_root().string()
        });
    }

    std::vector<std::filesystem::path> candidates;
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        candidates.push_back(it->path());
    }

    // Snapshot after listing: a directory seen above is either still pending
    // or already registered by the time these are read.
    std::set<std::string> referenced = pending_.snapshot();
    for (auto& id : registry_->file_ids()) {
        referenced.insert(std::move(id));
    }

    std::vector<std::filesystem::path> orphans;
    for (const auto& candidate : candidates) {
        if (referenced.count(candidate.filename().string()) == 0) {
            orphans.push_back(candidate);
        }
    }

    CleanupReport report;
    for (size_t i = 0; i < orphans.size(); ++i) {
        if (deadline.expired()) {
            report.timed_out = true;
            log::logger()->warn("Orphan sweep stopped at deadline remaining={}", orphans.size() - i);
            break;
        }
        const auto& orphan = orphans[i];
        const CleanupReport removed = remove_file_dir(orphan);
        report.objects_deleted += removed.objects_deleted;
        report.objects_failed += removed.objects_failed;
        log::logger()->info("Removed orphaned file prefix path={}", orphan.string());
    }
    return report;
}

CleanupReport LocalStorageBackend::remove_file_dir(const std::filesystem::path& dir) const {
    CleanupReport report;
    std::error_code ec;
    const auto removed = std::filesystem::remove_all(dir, ec);
    if (ec) {
        ++report.objects_failed;
        log::logger()->warn("Failed to remove file directory path={} error={}", dir.string(), ec.message());
        return report;
    }
    report.objects_deleted = static_cast<size_t>(removed);
    return report;
}

} // namespace storage
} // namespace lore
