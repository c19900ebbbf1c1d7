#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <log.hpp>
#include <persistency/path_resolver.hpp>
#include <studio/core/result.hpp>

namespace persistency {

// Whole-datastore reads. Both calls create the datastore directory, so a
// datastore that was never written enumerates as empty. Ordering follows the
// filesystem and is not stable; List() and All() are separate walks and
// their orders need not agree.
class DatastoreEnumerator {
public:
    explicit DatastoreEnumerator(PathResolver resolver);

    // Every immediate entry whose name is UTF-8, files and directories alike.
    // Names that fail UTF-8 decoding are skipped.
    studio::core::Result<std::vector<std::string>> List(std::string_view datastore) const noexcept;

    // Contents of every regular file; unreadable files are skipped.
    studio::core::Result<std::vector<studio::core::Bytes>> All(std::string_view datastore) const noexcept;

private:
    PathResolver resolver_;
    studio::log::Logger log_;
};

} // namespace persistency
