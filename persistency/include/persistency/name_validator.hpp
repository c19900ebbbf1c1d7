#pragma once
#include <string_view>
#include <studio/core/result.hpp>

namespace persistency {

// Datastore and key names: one or more of [a-z-]. Excludes '/', '.', so a
// name can never leave its parent directory.
bool IsValidName(std::string_view name) noexcept;

studio::core::Result<void> ValidateName(std::string_view name,
                                        studio::core::NameRole role) noexcept;

} // namespace persistency
