#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include <studio/core/result.hpp>
#include <persistency/blob_store.hpp>
#include <persistency/datastore_enumerator.hpp>
#include <persistency/path_resolver.hpp>

namespace studio::per {

// Named blobs grouped in named datastores under
// <app_data_dir>/studio-datastores/<datastore>/<key>.
class DatastoreStorage {
public:
    explicit DatastoreStorage(const std::string& app_data_dir)
        : resolver_(app_data_dir), blobs_(resolver_), enumerator_(resolver_) {}

    core::Result<core::Vector<core::String>> List(core::StringView datastore) const noexcept {
        return enumerator_.List(datastore);
    }

    // Values only, in directory order. Not correlated with List(); use Get() per key for pairs.
    core::Result<core::Vector<core::Bytes>> All(core::StringView datastore) const noexcept {
        return enumerator_.All(datastore);
    }

    core::Result<std::optional<core::Bytes>> Get(core::StringView datastore, core::StringView key) const noexcept {
        return blobs_.Get(datastore, key);
    }

    core::Result<std::optional<core::String>> GetString(core::StringView datastore, core::StringView key) const noexcept {
        return blobs_.GetString(datastore, key);
    }

    core::Result<void> Put(core::StringView datastore, core::StringView key, const core::Bytes& value) noexcept {
        return blobs_.Put(datastore, key, value);
    }

    core::Result<void> PutString(core::StringView datastore, core::StringView key, core::StringView value) noexcept {
        return blobs_.PutString(datastore, key, value);
    }

    core::Result<void> Delete(core::StringView datastore, core::StringView key) noexcept {
        return blobs_.Delete(datastore, key);
    }

    core::Result<bool> Exists(core::StringView datastore, core::StringView key) const noexcept {
        return blobs_.Exists(datastore, key);
    }

    // Stored as pretty-printed text (2-space indent).
    core::Result<void> PutJson(core::StringView datastore, core::StringView key,
                               const nlohmann::json& value) noexcept;

    // kDecode when the stored text is not a JSON document.
    core::Result<std::optional<nlohmann::json>> GetJson(core::StringView datastore,
                                                        core::StringView key) const noexcept;

    const std::filesystem::path& AppDataDir() const noexcept { return resolver_.Root(); }

private:
    persistency::PathResolver resolver_;
    persistency::BlobStore blobs_;
    persistency::DatastoreEnumerator enumerator_;
};

using SharedHandle = std::shared_ptr<DatastoreStorage>;

// Host collaborator: app_data_dir() -> Path | Error
using AppDataDirProvider = std::function<core::Result<std::string>()>;

core::Result<SharedHandle> OpenDatastoreStorage(const AppDataDirProvider& app_data_dir) noexcept;

// Looks `app_id` up in the loaded StorageRegistry manifest.
core::Result<SharedHandle> OpenDatastoreStorage(const std::string& app_id) noexcept;

} // namespace studio::per
