#pragma once

#include "lore/registry/registry_store.hpp"

#include <atomic>
#include <mutex>

namespace lore {
namespace testing {

/**
 * @brief In-memory registry sink with failure injection
 */
class MockRegistryStore : public registry::IRegistryStore {
public:
    // Configuration
    bool should_fail_load = false;
    std::atomic<bool> should_fail_save{false};

    // State tracking
    std::optional<std::string> stored;
    std::atomic<int> save_calls{0};

    Expected<std::optional<std::string>> load() override {
        if (should_fail_load) {
            return tl::unexpected(Error{ErrorCode::StorageReadFailed, "Injected load failure"});
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return stored;
    }

    Expected<void> save(const std::string& serialized) override {
        ++save_calls;
        if (should_fail_save) {
            return tl::unexpected(Error{ErrorCode::StorageWriteFailed, "Injected save failure"});
        }
        std::lock_guard<std::mutex> lock(mutex_);
        stored = serialized;
        return {};
    }

    std::string location() const override {
        return "memory://registry.json";
    }

    std::optional<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored;
    }

private:
    std::mutex mutex_;
};

} // namespace testing
} // namespace lore
