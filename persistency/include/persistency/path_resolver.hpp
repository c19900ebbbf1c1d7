#pragma once
#include <filesystem>
#include <string_view>
#include <utility>
#include <studio/core/result.hpp>

namespace persistency {

// Maps (root, datastore, key) onto <root>/studio-datastores/<datastore>/<key>.
class PathResolver {
public:
    static constexpr std::string_view kDatastoresDirName = "studio-datastores";

    explicit PathResolver(std::filesystem::path root) : root_(std::move(root)) {}

    const std::filesystem::path& Root() const noexcept { return root_; }
    std::filesystem::path DatastoresDir() const { return root_ / kDatastoresDirName; }

    // Validates the name, then creates the directory chain if missing.
    studio::core::Result<std::filesystem::path>
    ResolveDatastoreDir(std::string_view datastore) const noexcept;

    // Validates key and datastore, resolves the datastore dir (creating it)
    // and returns the entry path. The entry file itself is not created.
    studio::core::Result<std::filesystem::path>
    ResolveEntryPath(std::string_view datastore, std::string_view key) const noexcept;

private:
    std::filesystem::path root_;
};

} // namespace persistency
