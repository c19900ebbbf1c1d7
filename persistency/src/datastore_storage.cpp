#include <studio/per/datastore_storage.hpp>
#include <persistency/storage_registry.hpp>
#include <memory>

namespace studio::per {

using core::ErrorCode;
using core::Result;

Result<void> DatastoreStorage::PutJson(core::StringView datastore, core::StringView key,
                                       const nlohmann::json& value) noexcept {
    std::string text;
    try {
        text = value.dump(2);
    } catch (const nlohmann::json::type_error& e) {   // invalid UTF-8 inside a string member
        return ErrorCode::Decode(e.what());
    }
    return blobs_.PutString(datastore, key, text);
}

Result<std::optional<nlohmann::json>>
DatastoreStorage::GetJson(core::StringView datastore, core::StringView key) const noexcept {
    auto text = blobs_.GetString(datastore, key);
    if (!text) return text.Error();
    if (!text.Value()) return std::optional<nlohmann::json>{};

    try {
        return std::optional<nlohmann::json>(nlohmann::json::parse(*text.Value()));
    } catch (const nlohmann::json::parse_error& e) {
        return ErrorCode::Decode(e.what());
    }
}

Result<SharedHandle> OpenDatastoreStorage(const AppDataDirProvider& app_data_dir) noexcept {
    if (!app_data_dir) return ErrorCode::Config("no app data directory provider");
    auto dir = app_data_dir();
    if (!dir) return dir.Error();
    if (dir.Value().empty()) return ErrorCode::Config("app data directory is empty");
    return std::make_shared<DatastoreStorage>(dir.Value());
}

Result<SharedHandle> OpenDatastoreStorage(const std::string& app_id) noexcept {
    auto& reg = ::persistency::StorageRegistry::Instance();
    if (!reg.IsInitialized()) {
        return ErrorCode::Config("storage registry is not initialized");
    }

    auto cfg = reg.Lookup(app_id);
    if (!cfg) {
        return ErrorCode::Config("no manifest entry for application '" + app_id + "'");
    }
    return OpenDatastoreStorage([&cfg] { return ::persistency::ResolveAppDataDir(*cfg); });
}

} // namespace studio::per
