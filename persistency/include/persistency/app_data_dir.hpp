#pragma once
#include <string>
#include <studio/core/result.hpp>

namespace persistency {

// Per-user, per-application writable directory for `identifier`
// (e.g. "dev.studio.desktop"), following the platform's data-dir convention.
// Does not create the directory.
studio::core::Result<std::string> DefaultAppDataDir(const std::string& identifier) noexcept;

} // namespace persistency
