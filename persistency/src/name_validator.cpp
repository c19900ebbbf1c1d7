#include <persistency/name_validator.hpp>
#include <algorithm>
#include <string>

namespace persistency {

namespace {
inline bool name_char_ok(char c) {
    return (c >= 'a' && c <= 'z') || c == '-';
}
} // namespace

bool IsValidName(std::string_view name) noexcept {
    return !name.empty() && std::all_of(name.begin(), name.end(), name_char_ok);
}

studio::core::Result<void> ValidateName(std::string_view name,
                                        studio::core::NameRole role) noexcept {
    using studio::core::ErrorCode;
    const std::string role_str(studio::core::ToString(role));
    if (name.empty()) {
        return ErrorCode::InvalidName(std::string(name), role, role_str + " name must not be empty");
    }
    if (!IsValidName(name)) {
        return ErrorCode::InvalidName(std::string(name), role,
                                      role_str + " (" + std::string(name) + ") contains invalid characters");
    }
    return {};
}

} // namespace persistency
