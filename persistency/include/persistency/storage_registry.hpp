#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <atomic>
#include <studio/core/result.hpp>

namespace persistency {

struct StorageConfig {
    std::string app_id;
    std::string identifier;      // bundle id used for the default data dir
    std::string data_dir;        // explicit Application Data Root; empty -> platform default
    std::string log_level{"info"};
    std::string log_file;        // empty -> console only
};

// Application manifest, loaded once at startup.
class StorageRegistry {
public:
    static StorageRegistry& Instance();

    // Load the JSON manifest; replaces any previous contents
    studio::core::Result<void> InitFromFile(const std::string& config_path) noexcept;
    studio::core::Result<void> InitFromString(const std::string& json_text) noexcept;

    std::optional<StorageConfig> Lookup(const std::string& app_id) const;

    bool IsInitialized() const noexcept { return inited_.load(std::memory_order_acquire); }
    void Clear() noexcept;

private:
    StorageRegistry() = default;
    StorageRegistry(const StorageRegistry&) = delete;
    StorageRegistry& operator=(const StorageRegistry&) = delete;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, StorageConfig> map_;
    std::atomic<bool> inited_{false};
};

// data_dir when set, otherwise DefaultAppDataDir(identifier)
studio::core::Result<std::string> ResolveAppDataDir(const StorageConfig& cfg) noexcept;

} // namespace persistency
