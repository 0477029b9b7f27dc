#pragma once

#include "../types.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace lore {
namespace registry {

/**
 * @brief Durable sink for the serialized registry document
 *
 * Implementations store the whole document as one unit and replace it
 * atomically from the reader's point of view.
 */
class IRegistryStore {
public:
    virtual ~IRegistryStore() = default;

    /**
     * @brief Read the persisted document
     *
     * @return Expected<std::optional<std::string>> Serialized JSON, nullopt if
     *         nothing has been persisted yet, or a StorageReadFailed error
     */
    virtual Expected<std::optional<std::string>> load() = 0;

    /**
     * @brief Replace the persisted document
     */
    virtual Expected<void> save(const std::string& serialized) = 0;

    /** @brief Human-readable location used in logs and error context. */
    virtual std::string location() const = 0;
};

/**
 * @brief Registry sink backed by a single JSON file
 *
 * Writes go to a sibling temporary file that is renamed over the target, so
 * readers never observe a partially written registry.
 */
class FileRegistryStore : public IRegistryStore {
public:
    explicit FileRegistryStore(std::filesystem::path path)
        : path_(std::move(path))
    {}

    Expected<std::optional<std::string>> load() override {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            if (ec) {
                return tl::unexpected(Error{
                    ErrorCode::StorageReadFailed,
                    "Failed to stat registry file: " + ec.message(),
                    path_.string()
                });
            }
            return std::optional<std::string>{};
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in.is_open()) {
            return tl::unexpected(Error{
                ErrorCode::StorageReadFailed,
                "Failed to open registry file for reading",
                path_.string()
            });
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            return tl::unexpected(Error{
                ErrorCode::StorageReadFailed,
                "Failed to read registry file",
                path_.string()
            });
        }
        return std::optional<std::string>{buffer.str()};
    }

    Expected<void> save(const std::string& serialized) override {
        auto tmp_path = path_;
        tmp_path += ".tmp";

        {
            std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                return tl::unexpected(Error{
                    ErrorCode::StorageWriteFailed,
                    "Failed to open registry file for writing",
                    tmp_path.string()
                });
            }
            out << serialized;
            out.flush();
            if (!out.good()) {
                return tl::unexpected(Error{
                    ErrorCode::StorageWriteFailed,
                    "Failed to write registry file",
                    tmp_path.string()
                });
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, path_, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return tl::unexpected(Error{
                ErrorCode::StorageWriteFailed,
                "Failed to replace registry file: " + ec.message(),
                path_.string()
            });
        }
        return {};
    }

    std::string location() const override {
        return path_.string();
    }

private:
    std::filesystem::path path_;
};

} // namespace registry
} // namespace lore
