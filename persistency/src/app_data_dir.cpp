#include <persistency/app_data_dir.hpp>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

using studio::core::ErrorCode;
using studio::core::Result;

namespace {

inline const char* env_nonempty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

inline bool identifier_is_safe(const std::string& id) {
    return !id.empty()
        && id.find('/') == std::string::npos
        && id.find('\\') == std::string::npos
        && id.find("..") == std::string::npos;
}

Result<fs::path> platform_data_dir() {
#if defined(_WIN32)
    if (const char* appdata = env_nonempty("APPDATA")) return fs::path(appdata);
    return ErrorCode::Config("APPDATA is not set");
#elif defined(__APPLE__)
    if (const char* home = env_nonempty("HOME"))
        return fs::path(home) / "Library" / "Application Support";
    return ErrorCode::Config("HOME is not set");
#else
    // XDG_DATA_HOME must be absolute to be honoured
    if (const char* xdg = env_nonempty("XDG_DATA_HOME"); xdg && fs::path(xdg).is_absolute())
        return fs::path(xdg);
    if (const char* home = env_nonempty("HOME"))
        return fs::path(home) / ".local" / "share";
    return ErrorCode::Config("neither XDG_DATA_HOME nor HOME is set");
#endif
}

} // namespace

namespace persistency {

Result<std::string> DefaultAppDataDir(const std::string& identifier) noexcept {
    if (!identifier_is_safe(identifier)) {
        return ErrorCode::Config("invalid application identifier '" + identifier + "'");
    }
    auto base = platform_data_dir();
    if (!base) return base.Error();
    return (base.Value() / identifier).string();
}

} // namespace persistency
