#include <persistency/path_resolver.hpp>
#include <persistency/name_validator.hpp>
#include <system_error>

namespace fs = std::filesystem;

using studio::core::ErrorCode;
using studio::core::NameRole;
using studio::core::Result;

namespace persistency {

Result<fs::path> PathResolver::ResolveDatastoreDir(std::string_view datastore) const noexcept {
    if (auto v = ValidateName(datastore, NameRole::kDatastore); !v) return v.Error();

    fs::path dir = DatastoresDir() / std::string(datastore);
    std::error_code ec;
    fs::create_directories(dir, ec);   // false + no ec when it already exists
    if (ec) {
        return ErrorCode::Io("cannot create datastore directory " + dir.string() + ": " + ec.message(),
                             ec.value());
    }
    return dir;
}

Result<fs::path> PathResolver::ResolveEntryPath(std::string_view datastore,
                                                std::string_view key) const noexcept {
    if (auto v = ValidateName(key, NameRole::kKey); !v) return v.Error();

    auto dir = ResolveDatastoreDir(datastore);
    if (!dir) return dir.Error();
    return dir.Value() / std::string(key);
}

} // namespace persistency
