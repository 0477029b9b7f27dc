#include "lore/storage/cloud_storage.hpp"
#include "lore/log.hpp"
#include "lore/util/uuid.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <system_error>

namespace lore {
namespace storage {

namespace detail {

std::string content_type_for(const std::string& relative_path) {
    if (archive::is_markdown(relative_path)) {
        return "text/markdown";
    }
    std::string ext = std::filesystem::path(relative_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (ext == ".txt") {
        return "text/plain";
    }
    return "application/octet-stream";
}

} // namespace detail

namespace {

constexpr const char* kFilesPrefix = "files/";

std::string file_prefix(const std::string& file_id) {
    return kFilesPrefix + file_id;
}

// Document paths come back from list_documents(); anything else is refused.
bool is_safe_relative_key(const std::string& relative_path) {
    if (relative_path.empty() || relative_path.front() == '/') {
        return false;
    }
    std::istringstream segments(relative_path);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
    }
    return relative_path.back() != '/';
}

// Removes the extraction scratch directory on scope exit.
struct ScratchDir {
    std::filesystem::path path;

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) {
            log::logger()->warn("Failed to remove scratch directory path={} error={}", path.string(), ec.message());
        }
    }
};

} // namespace

Expected<std::unique_ptr<CloudStorageBackend>> CloudStorageBackend::open(
    std::shared_ptr<IObjectStore> store,
    std::shared_ptr<ObjectCache> cache,
    CloudStorageOptions options
) {
    if (!store) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Object store cannot be null"});
    }
    if (!cache) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Object cache cannot be null"});
    }

    const auto setup_deadline = Deadline::after(
        std::chrono::duration_cast<std::chrono::milliseconds>(options.operation_timeout));
    auto exists = store->bucket_exists(setup_deadline);
    if (!exists) {
        return tl::unexpected(exists.error());
    }
    if (!*exists) {
        log::logger()->info("Bucket does not exist, creating bucket={} project={}",
                            store->bucket(), options.project_id);
        if (auto created = store->create_bucket(options.project_id, setup_deadline); !created) {
            return tl::unexpected(created.error());
        }
    }

    auto reg = registry::Registry::open(std::make_shared<ObjectRegistryStore>(store), options.default_agent);
    if (!reg) {
        return tl::unexpected(reg.error());
    }

    log::logger()->info("Cloud storage ready bucket={} cache={}", store->bucket(), cache->root().string());
    return std::unique_ptr<CloudStorageBackend>(new CloudStorageBackend(
        std::move(store), std::move(cache), std::move(*reg), std::move(options)));
}

Expected<UploadResult> CloudStorageBackend::store_knowledge_file(
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

    const std::string prefix = file_prefix(*file_id);
    PendingUploads::Guard pending(pending_, *file_id);

    auto rollback = [&](const Error& err) -> Expected<UploadResult> {
        log::logger()->warn("Upload failed, removing objects prefix={} error={}", prefix, err.to_string());
        delete_prefix(prefix + "/", sweep_deadline(Deadline::none()));
        return tl::unexpected(err);
    };

    if (auto put = store_->put_object(prefix + "/content.zip", content, "application/zip", deadline); !put) {
        return rollback(put.error());
    }

    ScratchDir scratch{cache_->scratch_dir() / *file_id};
    ExtractionResult extraction = extractor_.extract_buffer(content, scratch.path);
    if (!extraction.success) {
        return rollback(extraction.error.value_or(Error{ErrorCode::ArchiveReadFailed, "Extraction failed"}));
    }

    if (auto uploaded = upload_extracted(scratch.path, prefix, deadline); !uploaded) {
        return rollback(uploaded.error());
    }
    if (auto ok = deadline.check("store_knowledge_file"); !ok) {
        return rollback(ok.error());
    }

    KnowledgeFile file;
    file.id = *file_id;
    file.name = name;
    file.description = description;
    file.file_path = prefix;
    file.agent_ids = agent_ids;
    file.uploaded_at = lore::detail::now_micros();
    file.file_size = static_cast<int64_t>(content.size());
    file.content_type = content_type;

    if (auto added = registry_->add_file(file); !added) {
        return rollback(added.error());
    }

    log::logger()->info("Stored knowledge file id={} name={} bucket={} files={} markdown={}",
                        file.id, file.name, store_->bucket(),
                        extraction.files_extracted, extraction.markdown_files);
    return UploadResult{std::move(file), extraction};
}

Expected<KnowledgeFile> CloudStorageBackend::get_knowledge_file(const std::string& file_id) {
    return registry_->find_file(file_id);
}

std::vector<KnowledgeFile> CloudStorageBackend::get_knowledge_files_for_agent(const std::string& agent_id) {
    return registry_->files_for_agent(agent_id);
}

std::vector<KnowledgeFile> CloudStorageBackend::get_all_knowledge_files() {
    return registry_->files();
}

Expected<CleanupReport> CloudStorageBackend::delete_knowledge_file(
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

    CleanupReport report = delete_prefix(removed->file_path + "/", sweep_deadline(deadline));
    if (report.complete()) {
        log::logger()->info("Deleted knowledge file id={} objects={}", file_id, report.objects_deleted);
    } else {
        log::logger()->warn("Deleted knowledge file with incomplete cleanup id={} deleted={} failed={} timed_out={}",
                            file_id, report.objects_deleted, report.objects_failed, report.timed_out);
    }
    return report;
}

std::vector<Agent> CloudStorageBackend::get_all_agents() {
    return registry_->agents();
}

std::optional<Agent> CloudStorageBackend::get_agent(const std::string& agent_id) {
    return registry_->find_agent(agent_id);
}

Expected<Agent> CloudStorageBackend::create_agent(
    const std::string& id,
    const std::string& name,
    const std::string& description,
    const std::string& tenant_id
) {
    return registry_->create_agent(id, name, description, tenant_id);
}

Expected<std::vector<std::string>> CloudStorageBackend::list_documents(
    const KnowledgeFile& file,
    const Deadline& deadline
) {
    const std::string prefix = file.file_path + "/extracted/";
    auto objects = store_->list_objects(prefix, deadline);
    if (!objects) {
        return tl::unexpected(objects.error());
    }

    std::vector<std::string> documents;
    documents.reserve(objects->size());
    for (const auto& object : *objects) {
        if (object.name.size() > prefix.size() && object.name.back() != '/') {
            documents.push_back(object.name.substr(prefix.size()));
        }
    }
    std::sort(documents.begin(), documents.end());
    return documents;
}

Expected<std::string> CloudStorageBackend::read_document(
    const KnowledgeFile& file,
    const std::string& relative_path,
    const Deadline& deadline
) {
    if (!is_safe_relative_key(relative_path)) {
        return tl::unexpected(Error{ErrorCode::InvalidArchiveEntry, "Invalid document path", relative_path});
    }
    if (auto ok = deadline.check("read_document"); !ok) {
        return tl::unexpected(ok.error());
    }

    const std::string key = file.file_path + "/extracted/" + relative_path;
    return cache_->get_or_fetch(key, [&]() {
        return store_->get_object(key, deadline);
    });
}

Expected<CleanupReport> CloudStorageBackend::sweep_orphans(const Deadline& deadline) {
    const Deadline budget = sweep_deadline(deadline);
    auto objects = store_->list_objects(kFilesPrefix, budget);
    if (!objects) {
        return tl::unexpected(objects.error());
    }

    std::map<std::string, std::vector<std::string>> by_file;
    const std::string files_prefix = kFilesPrefix;
    for (const auto& object : *objects) {
        const auto slash = object.name.find('/', files_prefix.size());
        if (slash == std::string::npos) {
            continue;
        }
        by_file[object.name.substr(files_prefix.size(), slash - files_prefix.size())].push_back(object.name);
    }

    std::set<std::string> referenced = pending_.snapshot();
    for (auto& id : registry_->file_ids()) {
        referenced.insert(std::move(id));
    }

    CleanupReport report;
    for (const auto& entry : by_file) {
        if (referenced.count(entry.first) != 0) {
            continue;
        }
        for (const auto& key : entry.second) {
            if (budget.expired()) {
                report.timed_out = true;
                log::logger()->warn("Orphan sweep stopped at deadline bucket={}", store_->bucket());
                return report;
            }
            auto deleted = store_->delete_object(key, budget);
            if (deleted || deleted.error().code == ErrorCode::NotFound) {
                ++report.objects_deleted;
            } else {
                ++report.objects_failed;
                log::logger()->warn("Failed to delete orphaned object key={} error={}",
                                    key, deleted.error().to_string());
            }
        }
        if (auto evicted = cache_->evict_prefix(file_prefix(entry.first) + "/"); !evicted) {
            log::logger()->warn("Failed to evict cache prefix={} error={}",
                                file_prefix(entry.first), evicted.error().to_string());
        }
        log::logger()->info("Removed orphaned file prefix={}", file_prefix(entry.first));
    }
    return report;
}

Expected<void> CloudStorageBackend::upload_extracted(
    const std::filesystem::path& scratch,
    const std::string& prefix,
    const Deadline& deadline
) {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(scratch, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }

        const std::string relative = it->path().lexically_relative(scratch).generic_string();
        std::ifstream in(it->path(), std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (!in.is_open() || in.bad()) {
            return tl::unexpected(Error{
                ErrorCode::StorageReadFailed,
                "Failed to read extracted file",
                it->path().string()
            });
        }

        const std::string key = prefix + "/extracted/" + relative;
        const std::string data = buffer.str();
        if (auto put = store_->put_object(key, data, detail::content_type_for(relative), deadline); !put) {
            return put;
        }
        if (auto cached = cache_->put(key, data); !cached) {
            log::logger()->debug("Failed to warm cache key={} error={}", key, cached.error().to_string());
        }
    }
    if (ec) {
        return tl::unexpected(Error{
            ErrorCode::StorageReadFailed,
            "Failed to walk extracted files: " + ec.message(),
            scratch.string()
        });
    }
    return {};
}

CleanupReport CloudStorageBackend::delete_prefix(const std::string& prefix, const Deadline& deadline) {
    CleanupReport report;

    auto objects = store_->list_objects(prefix, deadline);
    if (!objects) {
        ++report.objects_failed;
        report.timed_out = objects.error().code == ErrorCode::Timeout;
        log::logger()->warn("Failed to list objects for deletion prefix={} error={}",
                            prefix, objects.error().to_string());
    } else {
        for (const auto& object : *objects) {
            if (deadline.expired()) {
                report.timed_out = true;
                log::logger()->warn("Object deletion stopped at deadline prefix={} deleted={}",
                                    prefix, report.objects_deleted);
                break;
            }
            auto deleted = store_->delete_object(object.name, deadline);
            if (deleted || deleted.error().code == ErrorCode::NotFound) {
                ++report.objects_deleted;
            } else {
                ++report.objects_failed;
                if (deleted.error().code == ErrorCode::Timeout) {
                    report.timed_out = true;
                }
                log::logger()->warn("Failed to delete object key={} error={}",
                                    object.name, deleted.error().to_string());
            }
        }
    }

    if (auto evicted = cache_->evict_prefix(prefix); !evicted) {
        log::logger()->warn("Failed to evict cache prefix={} error={}", prefix, evicted.error().to_string());
    }
    return report;
}

} // namespace storage
} // namespace lore
