#pragma once
#include <string_view>
#include <nlohmann/json.hpp>
#include <studio/core/result.hpp>
#include <studio/per/datastore_storage.hpp>

namespace studio::per {

// Invoke-by-name boundary for the UI bridge. Returns {"ok": value} or
// {"error": {"message": ..., "code": ...}}. Bytes travel as arrays of 0-255.
nlohmann::json InvokeStorageCommand(DatastoreStorage& storage,
                                    std::string_view command,
                                    const nlohmann::json& args) noexcept;

bool IsStorageCommand(std::string_view command) noexcept;

// {"message": ..., "code": "INVALID_NAME" | "INVALID_KEY" | "DECODE" | "<errno>" | null | ...}
nlohmann::json ErrorToJson(const core::ErrorCode& err);

} // namespace studio::per
