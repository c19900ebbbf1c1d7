#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace studio::core {

// Error domain for the datastore layer
enum class StorageErrc {
    kSuccess = 0,
    kInvalidName,
    kIo,
    kDecode,
    kConfig,
    kInvalidArgument
};

// Which kind of name failed validation
enum class NameRole { kDatastore, kKey };

inline constexpr std::string_view ToString(NameRole role) {
    return role == NameRole::kDatastore ? "datastore" : "key";
}

class ErrorCode {
public:
    StorageErrc value;
    std::string message;
    std::optional<int> os_code;   // kIo only
    std::string name;             // kInvalidName only: offending input
    NameRole role{NameRole::kDatastore};

    ErrorCode(StorageErrc v) : value(v) {}
    ErrorCode(StorageErrc v, std::string msg) : value(v), message(std::move(msg)) {}

    static ErrorCode InvalidName(std::string value, NameRole role, std::string msg) {
        ErrorCode e(StorageErrc::kInvalidName, std::move(msg));
        e.name = std::move(value);
        e.role = role;
        return e;
    }

    static ErrorCode Io(std::string msg, std::optional<int> os_code = std::nullopt) {
        ErrorCode e(StorageErrc::kIo, std::move(msg));
        e.os_code = os_code;
        return e;
    }

    // std::error_code from <filesystem> calls; generic/system categories carry errno
    static ErrorCode Io(const std::error_code& ec) {
        return Io(ec.message(), ec.value());
    }

    static ErrorCode Decode(std::string msg) { return {StorageErrc::kDecode, std::move(msg)}; }
    static ErrorCode Config(std::string msg) { return {StorageErrc::kConfig, std::move(msg)}; }
    static ErrorCode InvalidArgument(std::string msg) {
        return {StorageErrc::kInvalidArgument, std::move(msg)};
    }

    operator bool() const { return value != StorageErrc::kSuccess; }
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    // Accept anything T can be built from (e.g. Bytes for Result<std::optional<Bytes>>)
    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, ErrorCode> &&
                                         !std::is_same_v<std::decay_t<U>, Result> &&
                                         std::is_constructible_v<T, U&&>>>
    Result(U&& v) : data_(std::in_place_index<0>, std::forward<U>(v)) {}
    Result(ErrorCode e) : data_(std::in_place_index<1>, std::move(e)) {}

    bool HasValue() const { return data_.index() == 0; }
    T& Value() { return std::get<0>(data_); }
    const T& Value() const { return std::get<0>(data_); }
    const ErrorCode& Error() const { return std::get<1>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
};

using String = std::string;
using StringView = std::string_view;
template<typename T> using Vector = std::vector<T>;
using Bytes = std::vector<std::uint8_t>;

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(StorageErrc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(std::move(e)) {}

    bool HasValue() const { return ok_; }
    void Value() const {}  // no-op
    const ErrorCode& Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace studio::core
