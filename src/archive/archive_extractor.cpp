#include "lore/archive/archive_extractor.hpp"
#include "lore/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <system_error>
#include <vector>
#include <miniz.h>

namespace lore {
namespace archive {

namespace {

// Owns an initialized miniz reader.
struct ZipReader {
    mz_zip_archive zip;
    bool open = false;

    ZipReader() {
        std::memset(&zip, 0, sizeof(zip));
    }

    ~ZipReader() {
        if (open) {
            mz_zip_reader_end(&zip);
        }
    }

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;
};

struct PlannedEntry {
    mz_uint index = 0;
    std::filesystem::path destination;
    std::string name;
    bool is_directory = false;
    uint64_t size = 0;
};

std::string zip_error(mz_zip_archive& zip) {
    const char* text = mz_zip_get_error_string(mz_zip_get_last_error(&zip));
    return text != nullptr ? text : "unknown zip error";
}

bool is_write_error(mz_zip_error err) {
    return err == MZ_ZIP_FILE_OPEN_FAILED ||
           err == MZ_ZIP_FILE_CREATE_FAILED ||
           err == MZ_ZIP_FILE_WRITE_FAILED ||
           err == MZ_ZIP_FILE_CLOSE_FAILED;
}

std::filesystem::path normalized_root(const std::filesystem::path& root) {
    auto normal = std::filesystem::absolute(root).lexically_normal();
    if (normal.filename().empty() && normal.has_parent_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

ExtractionResult extract_entries(mz_zip_archive& zip, const std::filesystem::path& destination) {
    const auto root = normalized_root(destination);

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return ExtractionResult::failure(Error{
            ErrorCode::StorageWriteFailed,
            "Failed to create extraction directory: " + ec.message(),
            root.string()
        });
    }

    // Validate every entry before writing anything.
    const mz_uint entry_count = mz_zip_reader_get_num_files(&zip);
    std::vector<PlannedEntry> plan;
    plan.reserve(entry_count);

    for (mz_uint i = 0; i < entry_count; ++i) {
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&zip, i, &stat)) {
            return ExtractionResult::failure(Error{
                ErrorCode::ArchiveReadFailed,
                "Failed to read zip entry header: " + zip_error(zip),
                std::to_string(i)
            });
        }

        const std::string name = stat.m_filename;
        auto resolved = resolve_entry_path(root, name);
        if (!resolved) {
            return ExtractionResult::failure(resolved.error());
        }

        if (stat.m_is_encrypted || !stat.m_is_supported) {
            return ExtractionResult::failure(Error{
                ErrorCode::ArchiveReadFailed,
                "Unsupported or encrypted zip entry",
                name
            });
        }

        PlannedEntry entry;
        entry.index = i;
        entry.destination = std::move(*resolved);
        entry.name = name;
        entry.is_directory = stat.m_is_directory != 0;
        entry.size = static_cast<uint64_t>(stat.m_uncomp_size);
        plan.push_back(std::move(entry));
    }

    ExtractionResult result;
    for (const auto& entry : plan) {
        if (entry.is_directory) {
            std::filesystem::create_directories(entry.destination, ec);
            if (ec) {
                return ExtractionResult::failure(Error{
                    ErrorCode::StorageWriteFailed,
                    "Failed to create directory: " + ec.message(),
                    entry.destination.string()
                });
            }
            continue;
        }

        std::filesystem::create_directories(entry.destination.parent_path(), ec);
        if (ec) {
            return ExtractionResult::failure(Error{
                ErrorCode::StorageWriteFailed,
                "Failed to create directory: " + ec.message(),
                entry.destination.parent_path().string()
            });
        }

        const std::string target = entry.destination.string();
        if (!mz_zip_reader_extract_to_file(&zip, entry.index, target.c_str(), 0)) {
            const mz_zip_error err = mz_zip_get_last_error(&zip);
            const char* text = mz_zip_get_error_string(err);
            return ExtractionResult::failure(Error{
                is_write_error(err) ? ErrorCode::StorageWriteFailed : ErrorCode::ArchiveReadFailed,
                std::string("Failed to extract file: ") + (text != nullptr ? text : "unknown zip error"),
                entry.name
            });
        }

        ++result.files_extracted;
        result.total_size_bytes += entry.size;
        if (is_markdown(entry.destination)) {
            ++result.markdown_files;
        }
    }

    result.success = true;
    log::logger()->debug("Extracted archive destination={} files={} markdown={} bytes={}",
                         root.string(), result.files_extracted, result.markdown_files,
                         result.total_size_bytes);
    return result;
}

} // namespace

bool is_markdown(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return ext == ".md";
}

Expected<std::filesystem::path> resolve_entry_path(
    const std::filesystem::path& root,
    const std::string& entry_name
) {
    if (entry_name.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidArchiveEntry, "Empty file path in zip"});
    }

    const std::filesystem::path relative(entry_name);
    if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
        return tl::unexpected(Error{ErrorCode::InvalidArchiveEntry, "Invalid file path in zip", entry_name});
    }

    const auto base = normalized_root(root);
    const auto candidate = (base / relative).lexically_normal();
    const auto back = candidate.lexically_relative(base);
    if (back.empty() || *back.begin() == "..") {
        return tl::unexpected(Error{ErrorCode::InvalidArchiveEntry, "Invalid file path in zip", entry_name});
    }
    return candidate;
}

ExtractionResult ArchiveExtractor::extract_file(
    const std::filesystem::path& archive_path,
    const std::filesystem::path& destination
) const {
    ZipReader reader;
    const std::string path = archive_path.string();
    if (!mz_zip_reader_init_file(&reader.zip, path.c_str(), 0)) {
        return ExtractionResult::failure(Error{
            ErrorCode::ArchiveReadFailed,
            "Failed to open zip file: " + zip_error(reader.zip),
            path
        });
    }
    reader.open = true;
    return extract_entries(reader.zip, destination);
}

ExtractionResult ArchiveExtractor::extract_buffer(
    const std::string& archive_bytes,
    const std::filesystem::path& destination
) const {
    ZipReader reader;
    if (!mz_zip_reader_init_mem(&reader.zip, archive_bytes.data(), archive_bytes.size(), 0)) {
        return ExtractionResult::failure(Error{
            ErrorCode::ArchiveReadFailed,
            "Failed to open zip archive: " + zip_error(reader.zip)
        });
    }
    reader.open = true;
    return extract_entries(reader.zip, destination);
}

} // namespace archive
} // namespace lore
