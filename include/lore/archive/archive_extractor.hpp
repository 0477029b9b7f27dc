#pragma once

#include "../types.hpp"
#include <filesystem>
#include <string>

namespace lore {
namespace archive {

/**
 * @brief True for paths whose extension is ".md" (case-insensitive)
 *
 * Shared by the extractor statistics and the retriever so both classify
 * documents identically.
 */
bool is_markdown(const std::filesystem::path& path);

/**
 * @brief Resolve an archive entry name against an extraction root
 *
 * Fails with ErrorCode::InvalidArchiveEntry when the name is empty,
 * absolute, or climbs out of the root through ".." components.
 *
 * @param root Extraction root
 * @param entry_name Entry name as stored in the archive
 * @return Expected<std::filesystem::path> Normalized destination inside root
 */
Expected<std::filesystem::path> resolve_entry_path(
    const std::filesystem::path& root,
    const std::string& entry_name
);

/**
 * @brief Unpacks ZIP archives into a destination directory
 *
 * Extraction is all-or-nothing at the archive level: every entry name is
 * validated before anything is written, and the first entry that cannot be
 * copied fails the whole extraction. Files written before a copy failure are
 * left in place; the caller decides what to do with them.
 *
 * Directories are created on demand and existing files are overwritten.
 *
 * @threadsafety Stateless; safe to share across threads as long as
 * concurrent calls use distinct destinations.
 */
class ArchiveExtractor {
public:
    /**
     * @brief Extract an archive stored on disk
     *
     * @param archive_path Path to the .zip file
     * @param destination Directory that receives the entries
     * @return ExtractionResult Statistics, with success=false and error set on failure
     */
    ExtractionResult extract_file(
        const std::filesystem::path& archive_path,
        const std::filesystem::path& destination
    ) const;

    /**
     * @brief Extract an archive held in memory
     */
    ExtractionResult extract_buffer(
        const std::string& archive_bytes,
        const std::filesystem::path& destination
    ) const;
};

} // namespace archive
} // namespace lore
