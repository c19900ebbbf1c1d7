// studio-storage: invoke a storage command against an application's datastores.
//
//   studio-storage [--config <manifest>] [--app <id>] [--data-dir <dir>] <command> [<json-args>]
//
// Prints the command envelope ({"ok":...} / {"error":...}) on stdout.
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <log.hpp>
#include <sinks_console.hpp>
#include <sinks_file.hpp>
#include <persistency/storage_registry.hpp>
#include <studio/per/datastore_storage.hpp>
#include <studio/per/storage_commands.hpp>

using json = nlohmann::json;
using namespace studio::log;
using persistency::StorageRegistry;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitCommandError = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string config_path{"manifests/studio.json"};
    std::string app_id{"studio"};
    std::string data_dir;   // overrides the manifest when set
    std::string command;
    std::string args_text{"{}"};
};

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--config <manifest>] [--app <id>] [--data-dir <dir>] <command> [<json-args>]\n"
              << "commands: storage_list storage_all storage_get storage_get_string\n"
              << "          storage_put storage_put_string storage_delete storage_exists\n";
}

bool parse_args(int argc, char** argv, CliOptions& o) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (a == "--config")        { if (!next(o.config_path)) return false; }
        else if (a == "--app")      { if (!next(o.app_id)) return false; }
        else if (a == "--data-dir") { if (!next(o.data_dir)) return false; }
        else if (a == "-h" || a == "--help") return false;
        else positional.push_back(std::move(a));
    }
    if (positional.empty() || positional.size() > 2) return false;
    o.command = positional[0];
    if (positional.size() == 2) o.args_text = positional[1];
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        usage(argv[0]);
        return kExitUsage;
    }

    json args = json::parse(opts.args_text, nullptr, /*allow_exceptions=*/false);
    if (args.is_discarded()) {
        std::cerr << "arguments are not valid JSON: " << opts.args_text << "\n";
        return kExitUsage;
    }

    std::string level_name{"warn"};
    std::string log_file;
    studio::per::AppDataDirProvider provider;

    if (!opts.data_dir.empty()) {
        provider = [dir = opts.data_dir]() -> studio::core::Result<std::string> { return dir; };
    } else {
        auto r = StorageRegistry::Instance().InitFromFile(opts.config_path);
        if (!r) {
            std::cout << json{{"error", studio::per::ErrorToJson(r.Error())}}.dump() << std::endl;
            return kExitCommandError;
        }
        auto cfg = StorageRegistry::Instance().Lookup(opts.app_id);
        if (!cfg) {
            std::cerr << "no manifest entry for application '" << opts.app_id << "'\n";
            return kExitUsage;
        }
        level_name = cfg->log_level;
        log_file = cfg->log_file;
        provider = [cfg]() { return persistency::ResolveAppDataDir(*cfg); };
    }

    LogManager::Instance().SetAppId(opts.app_id);
    LogManager::Instance().SetDefaultLevel(ParseLogLevel(level_name).value_or(LogLevel::kWarn));
    LogManager::Instance().AddSink(std::make_shared<ConsoleSink>());
    if (!log_file.empty()) {
        LogManager::Instance().AddSink(std::make_shared<FileSink>(log_file));
    }
    auto log = Logger::CreateLogger("CLI");

    auto handle = studio::per::OpenDatastoreStorage(provider);
    if (!handle) {
        STUDIO_LOGERROR(log, "cannot open storage: {}", handle.Error().message);
        std::cout << json{{"error", studio::per::ErrorToJson(handle.Error())}}.dump() << std::endl;
        return kExitCommandError;
    }

    STUDIO_LOGDEBUG(log, "{} on {}", opts.command, handle.Value()->AppDataDir().string());
    json reply = studio::per::InvokeStorageCommand(*handle.Value(), opts.command, args);
    std::cout << reply.dump() << std::endl;
    return reply.contains("ok") ? kExitOk : kExitCommandError;
}
