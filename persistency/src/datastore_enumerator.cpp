#include <persistency/datastore_enumerator.hpp>
#include <persistency/blob_store.hpp>
#include <system_error>
#include <utf8/core.h>

namespace fs = std::filesystem;

using studio::core::Bytes;
using studio::core::ErrorCode;
using studio::core::Result;

namespace persistency {

namespace {

Result<fs::directory_iterator> open_dir(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return ErrorCode::Io("cannot read datastore directory " + dir.string() + ": " + ec.message(),
                             ec.value());
    }
    return it;
}

} // namespace

DatastoreEnumerator::DatastoreEnumerator(PathResolver resolver)
    : resolver_(std::move(resolver)),
      log_(studio::log::Logger::CreateLogger("STOR")) {}

Result<std::vector<std::string>>
DatastoreEnumerator::List(std::string_view datastore) const noexcept {
    auto dir = resolver_.ResolveDatastoreDir(datastore);
    if (!dir) return dir.Error();

    auto it = open_dir(dir.Value());
    if (!it) return it.Error();

    std::vector<std::string> keys;
    std::error_code ec;
    for (auto& cur = it.Value(); cur != fs::directory_iterator(); cur.increment(ec)) {
        if (ec) break;
        std::string name = cur->path().filename().string();
        if (!utf8::is_valid(name.begin(), name.end())) {
            STUDIO_LOGDEBUG(log_, "list {}: skipping entry with non UTF-8 name", datastore);
            continue;
        }
        keys.push_back(std::move(name));
    }
    if (ec) {
        STUDIO_LOGWARN(log_, "list {}: enumeration stopped early: {}", datastore, ec.message());
    }
    return keys;
}

Result<std::vector<Bytes>>
DatastoreEnumerator::All(std::string_view datastore) const noexcept {
    auto dir = resolver_.ResolveDatastoreDir(datastore);
    if (!dir) return dir.Error();

    auto it = open_dir(dir.Value());
    if (!it) return it.Error();

    std::vector<Bytes> values;
    std::error_code ec;
    for (auto& cur = it.Value(); cur != fs::directory_iterator(); cur.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!cur->is_regular_file(type_ec) || type_ec) continue;

        auto content = ReadEntryFile(cur->path());
        if (!content) {
            STUDIO_LOGWARN(log_, "all {}: skipping unreadable entry {}: {}",
                           datastore, cur->path().filename().string(), content.Error().message);
            continue;
        }
        // Removed between enumeration and read
        if (!content.Value()) continue;
        values.push_back(std::move(*content.Value()));
    }
    if (ec) {
        STUDIO_LOGWARN(log_, "all {}: enumeration stopped early: {}", datastore, ec.message());
    }
    return values;
}

} // namespace persistency
