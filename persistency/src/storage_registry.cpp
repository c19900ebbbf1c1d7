#include <persistency/storage_registry.hpp>
#include <persistency/app_data_dir.hpp>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;
using studio::core::ErrorCode;
using studio::core::Result;

namespace persistency {

StorageRegistry& StorageRegistry::Instance() {
    static StorageRegistry r;
    return r;
}

Result<void> StorageRegistry::InitFromFile(const std::string& path) noexcept {
    std::ifstream in(path);
    if (!in) {
        Clear();
        return ErrorCode::Config("cannot open manifest " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return InitFromString(ss.str());
}

Result<void> StorageRegistry::InitFromString(const std::string& text) noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    map_.clear();
    inited_.store(false, std::memory_order_release);

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return ErrorCode::Config(std::string("manifest is not valid JSON: ") + e.what());
    }

    try {
        for (const auto& a : j.at("applications")) {
            StorageConfig cfg;
            cfg.app_id     = a.at("app_id").get<std::string>();
            cfg.identifier = a.value("identifier", cfg.app_id);
            cfg.data_dir   = a.value("data_dir", std::string{});
            cfg.log_level  = a.value("log_level", std::string{"info"});
            cfg.log_file   = a.value("log_file", std::string{});
            if (cfg.app_id.empty()) {
                map_.clear();
                return ErrorCode::Config("manifest entry with empty app_id");
            }
            std::string id = cfg.app_id;
            map_.insert_or_assign(std::move(id), std::move(cfg));
        }
    } catch (const json::exception& e) {
        map_.clear();
        return ErrorCode::Config(std::string("malformed manifest: ") + e.what());
    }

    inited_.store(true, std::memory_order_release);
    return {};
}

std::optional<StorageConfig> StorageRegistry::Lookup(const std::string& app_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = map_.find(app_id);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

void StorageRegistry::Clear() noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    map_.clear();
    inited_.store(false, std::memory_order_release);
}

Result<std::string> ResolveAppDataDir(const StorageConfig& cfg) noexcept {
    if (!cfg.data_dir.empty()) return cfg.data_dir;
    return DefaultAppDataDir(cfg.identifier);
}

} // namespace persistency
