#pragma once

#include <mutex>
#include <set>
#include <string>

namespace lore {
namespace storage {

/**
 * @brief File IDs whose bytes are being written but are not yet registered
 *
 * Orphan sweeps treat these as referenced so they never race an upload.
 */
class PendingUploads {
public:
    /// Registers an ID for the lifetime of the guard.
    class Guard {
    public:
        Guard(PendingUploads& owner, std::string id)
            : owner_(owner)
            , id_(std::move(id))
        {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.ids_.insert(id_);
        }

        ~Guard() {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.ids_.erase(id_);
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        PendingUploads& owner_;
        std::string id_;
    };

    std::set<std::string> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ids_;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> ids_;
};

} // namespace storage
} // namespace lore
