#include <persistency/blob_store.hpp>
#include <persistency/name_validator.hpp>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utf8/core.h>

#include <unistd.h>     // read, write, close, unlink
#include <fcntl.h>      // open
#include <sys/stat.h>

namespace fs = std::filesystem;

using studio::core::Bytes;
using studio::core::ErrorCode;
using studio::core::Result;

namespace {

// Owns a POSIX descriptor for the duration of one operation.
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { if (fd_ >= 0) ::close(fd_); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // close() can report deferred write errors (NFS, quota); callers on the write path check it
    int release_and_close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

inline ErrorCode errno_error(const char* what, const fs::path& file, int err) {
    return ErrorCode::Io(std::string(what) + " " + file.string() + ": " + std::strerror(err), err);
}

} // namespace

namespace persistency {

Result<std::optional<Bytes>> ReadEntryFile(const fs::path& file) noexcept {
    ScopedFd fd(::open(file.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ENOENT) return std::optional<Bytes>{};
        return errno_error("cannot open", file, errno);
    }

    Bytes data;
    struct stat st{};
    if (::fstat(fd.get(), &st) == 0 && st.st_size > 0) {
        data.reserve(static_cast<size_t>(st.st_size));
    }

    std::uint8_t buf[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_error("cannot read", file, errno);   // e.g. EISDIR
        }
        if (n == 0) break;
        data.insert(data.end(), buf, buf + n);
    }
    return std::optional<Bytes>(std::move(data));
}

BlobStore::BlobStore(PathResolver resolver)
    : resolver_(std::move(resolver)),
      log_(studio::log::Logger::CreateLogger("STOR")) {}

Result<std::optional<Bytes>>
BlobStore::Get(std::string_view datastore, std::string_view key) const noexcept {
    auto path = resolver_.ResolveEntryPath(datastore, key);
    if (!path) return path.Error();

    auto r = ReadEntryFile(path.Value());
    if (!r) {
        STUDIO_LOGWARN(log_, "get {}/{} failed: {}", datastore, key, r.Error().message);
        return r;
    }
    STUDIO_LOGDEBUG(log_, "get {}/{} -> {}", datastore, key,
                    r.Value() ? std::to_string(r.Value()->size()) + " bytes" : std::string("absent"));
    return r;
}

Result<std::optional<std::string>>
BlobStore::GetString(std::string_view datastore, std::string_view key) const noexcept {
    auto r = Get(datastore, key);
    if (!r) return r.Error();
    if (!r.Value()) return std::optional<std::string>{};

    const Bytes& bytes = *r.Value();
    if (!utf8::is_valid(bytes.begin(), bytes.end())) {
        return ErrorCode::Decode("stream did not contain valid UTF-8");
    }
    return std::optional<std::string>(std::string(bytes.begin(), bytes.end()));
}

Result<void> BlobStore::WriteAll(std::string_view datastore, std::string_view key,
                                 const void* data, std::size_t size) noexcept {
    auto path = resolver_.ResolveEntryPath(datastore, key);
    if (!path) return path.Error();
    const fs::path& file = path.Value();

    ScopedFd fd(::open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        auto e = errno_error("cannot open", file, errno);
        STUDIO_LOGWARN(log_, "put {}/{} failed: {}", datastore, key, e.message);
        return e;
    }

    std::size_t off = 0;
    while (off < size) {
        ssize_t n = ::write(fd.get(), static_cast<const char*>(data) + off, size - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto e = errno_error("cannot write", file, errno);
            STUDIO_LOGWARN(log_, "put {}/{} failed: {}", datastore, key, e.message);
            return e;
        }
        off += static_cast<std::size_t>(n);
    }
    if (fd.release_and_close() != 0) {
        auto e = errno_error("cannot close", file, errno);
        STUDIO_LOGWARN(log_, "put {}/{} failed: {}", datastore, key, e.message);
        return e;
    }

    STUDIO_LOGDEBUG(log_, "put {}/{} ({} bytes)", datastore, key, size);
    return {};
}

Result<void> BlobStore::Put(std::string_view datastore, std::string_view key,
                            const Bytes& value) noexcept {
    return WriteAll(datastore, key, value.data(), value.size());
}

Result<void> BlobStore::PutString(std::string_view datastore, std::string_view key,
                                  std::string_view value) noexcept {
    // Name errors win over payload errors, matching Put
    if (auto p = resolver_.ResolveEntryPath(datastore, key); !p) return p.Error();
    if (!utf8::is_valid(value.begin(), value.end())) {
        return ErrorCode::Decode("value is not valid UTF-8");
    }
    return WriteAll(datastore, key, value.data(), value.size());
}

Result<void> BlobStore::Delete(std::string_view datastore, std::string_view key) noexcept {
    auto path = resolver_.ResolveEntryPath(datastore, key);
    if (!path) return path.Error();

    // unlink, not fs::remove: a directory under the datastore is not an entry
    if (::unlink(path.Value().c_str()) != 0) {
        if (errno == ENOENT) {
            STUDIO_LOGDEBUG(log_, "delete {}/{} (already absent)", datastore, key);
            return {};
        }
        auto e = errno_error("cannot remove", path.Value(), errno);
        STUDIO_LOGWARN(log_, "delete {}/{} failed: {}", datastore, key, e.message);
        return e;
    }
    STUDIO_LOGDEBUG(log_, "delete {}/{} (removed)", datastore, key);
    return {};
}

Result<bool> BlobStore::Exists(std::string_view datastore, std::string_view key) const noexcept {
    auto path = resolver_.ResolveEntryPath(datastore, key);
    if (!path) return path.Error();

    std::error_code ec;
    const bool present = fs::exists(path.Value(), ec);
    if (ec) {
        return ErrorCode::Io("cannot stat " + path.Value().string() + ": " + ec.message(), ec.value());
    }
    return present;
}

} // namespace persistency
