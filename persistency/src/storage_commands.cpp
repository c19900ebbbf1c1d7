#include <studio/per/storage_commands.hpp>
#include <array>
#include <string>

using nlohmann::json;

namespace studio::per {

using core::ErrorCode;
using core::Result;
using core::StorageErrc;

namespace {

constexpr std::array<std::string_view, 8> kCommands = {
    "storage_list", "storage_all", "storage_get", "storage_get_string",
    "storage_put", "storage_put_string", "storage_delete", "storage_exists",
};

Result<std::string> string_arg(const json& args, const char* name) {
    auto it = args.find(name);
    if (it == args.end()) {
        return ErrorCode::InvalidArgument(std::string("missing argument '") + name + "'");
    }
    if (!it->is_string()) {
        return ErrorCode::InvalidArgument(std::string("argument '") + name + "' must be a string");
    }
    return it->get<std::string>();
}

Result<core::Bytes> bytes_arg(const json& args, const char* name) {
    auto it = args.find(name);
    if (it == args.end()) {
        return ErrorCode::InvalidArgument(std::string("missing argument '") + name + "'");
    }
    if (!it->is_array()) {
        return ErrorCode::InvalidArgument(std::string("argument '") + name + "' must be an array of bytes");
    }
    core::Bytes out;
    out.reserve(it->size());
    for (const auto& b : *it) {
        if (!b.is_number_integer() || b.get<long long>() < 0 || b.get<long long>() > 255) {
            return ErrorCode::InvalidArgument(std::string("argument '") + name + "' holds a non-byte element");
        }
        out.push_back(static_cast<std::uint8_t>(b.get<long long>()));
    }
    return out;
}

json ok(json value) { return json{{"ok", std::move(value)}}; }
json fail(const ErrorCode& e) { return json{{"error", ErrorToJson(e)}}; }

template<typename T>
json wrap(const Result<T>& r) {
    if (!r) return fail(r.Error());
    return ok(json(r.Value()));
}

// Absent values serialise as null
template<typename T>
json wrap(const Result<std::optional<T>>& r) {
    if (!r) return fail(r.Error());
    if (!r.Value()) return ok(nullptr);
    return ok(json(*r.Value()));
}

json wrap(const Result<void>& r) {
    if (!r) return fail(r.Error());
    return ok(nullptr);
}

json dispatch(DatastoreStorage& storage, std::string_view command, const json& args) {
    if (!args.is_object()) {
        return fail(ErrorCode::InvalidArgument("arguments must be a JSON object"));
    }

    auto datastore = string_arg(args, "datastore");
    if (!datastore) return fail(datastore.Error());
    const std::string& ds = datastore.Value();

    if (command == "storage_list") return wrap(storage.List(ds));
    if (command == "storage_all")  return wrap(storage.All(ds));

    auto key = string_arg(args, "key");
    if (!key) return fail(key.Error());
    const std::string& k = key.Value();

    if (command == "storage_get")        return wrap(storage.Get(ds, k));
    if (command == "storage_get_string") return wrap(storage.GetString(ds, k));
    if (command == "storage_delete")     return wrap(storage.Delete(ds, k));
    if (command == "storage_exists")     return wrap(storage.Exists(ds, k));

    if (command == "storage_put") {
        auto value = bytes_arg(args, "value");
        if (!value) return fail(value.Error());
        return wrap(storage.Put(ds, k, value.Value()));
    }
    if (command == "storage_put_string") {
        auto value = string_arg(args, "value");
        if (!value) return fail(value.Error());
        return wrap(storage.PutString(ds, k, value.Value()));
    }

    return fail(ErrorCode(StorageErrc::kInvalidArgument, "unknown command '" + std::string(command) + "'"));
}

} // namespace

bool IsStorageCommand(std::string_view command) noexcept {
    for (auto c : kCommands) {
        if (c == command) return true;
    }
    return false;
}

json ErrorToJson(const ErrorCode& err) {
    json code = nullptr;
    switch (err.value) {
        case StorageErrc::kInvalidName:
            code = err.role == core::NameRole::kKey ? "INVALID_KEY" : "INVALID_NAME";
            break;
        case StorageErrc::kIo:
            if (err.os_code) code = std::to_string(*err.os_code);
            break;
        case StorageErrc::kDecode:          code = "DECODE"; break;
        case StorageErrc::kConfig:          code = "CONFIG"; break;
        case StorageErrc::kInvalidArgument: code = "INVALID_ARGS"; break;
        case StorageErrc::kSuccess:         break;
    }
    return json{{"message", err.message}, {"code", code}};
}

json InvokeStorageCommand(DatastoreStorage& storage, std::string_view command,
                          const json& args) noexcept {
    if (!IsStorageCommand(command)) {
        return json{{"error", {{"message", "unknown command '" + std::string(command) + "'"},
                               {"code", "UNKNOWN_COMMAND"}}}};
    }
    try {
        return dispatch(storage, command, args);
    } catch (const json::exception& e) {
        // Values that cannot be serialised back (e.g. a string that is not UTF-8)
        return fail(ErrorCode::Decode(e.what()));
    }
}

} // namespace studio::per
