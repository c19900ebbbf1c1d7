#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <log.hpp>
#include <persistency/path_resolver.hpp>
#include <studio/core/result.hpp>

namespace persistency {

// Single-entry CRUD. Each call is one synchronous filesystem action; there is
// no locking and no write-then-rename, so a reader racing a writer can see a
// partially written file.
class BlobStore {
public:
    explicit BlobStore(PathResolver resolver);

    // Absent entry -> empty optional, not an error.
    studio::core::Result<std::optional<studio::core::Bytes>>
    Get(std::string_view datastore, std::string_view key) const noexcept;

    // kDecode when the stored bytes are not UTF-8.
    studio::core::Result<std::optional<std::string>>
    GetString(std::string_view datastore, std::string_view key) const noexcept;

    studio::core::Result<void> Put(std::string_view datastore, std::string_view key,
                                   const studio::core::Bytes& value) noexcept;
    studio::core::Result<void> PutString(std::string_view datastore, std::string_view key,
                                         std::string_view value) noexcept;

    // Deleting a missing entry succeeds; a directory in the entry's place is kIo.
    studio::core::Result<void> Delete(std::string_view datastore, std::string_view key) noexcept;

    studio::core::Result<bool> Exists(std::string_view datastore, std::string_view key) const noexcept;

    const PathResolver& Resolver() const noexcept { return resolver_; }

private:
    studio::core::Result<void> WriteAll(std::string_view datastore, std::string_view key,
                                        const void* data, std::size_t size) noexcept;

    PathResolver resolver_;
    studio::log::Logger log_;
};

// Reads a whole file. ENOENT -> empty optional; any other failure -> kIo.
studio::core::Result<std::optional<studio::core::Bytes>>
ReadEntryFile(const std::filesystem::path& file) noexcept;

} // namespace persistency
