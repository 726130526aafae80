#include "shell/Router.hpp"
#include "shell/Usage.hpp"
#include "shell/helpers.hpp"
#include "shell/commands.hpp"
#include "sync/Error.hpp"
#include "sync/Lock.hpp"
#include "sync/Resolver.hpp"
#include "sync/model/Layout.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "fs/ops.hpp"
#include "log/Registry.hpp"

#include <yaml-cpp/exceptions.h>

#include <optional>

using namespace rcs::shell;
using namespace rcs::sync;
using namespace rcs::config;
using namespace rcs::log;

static constexpr const auto* BANNER = "========================================";

static CommandResult usageError(const std::string& msg) {
    Registry::shell()->error("{}", msg);
    return {1, usageText(), ""};
}

Router::Router(IO& io) : io_(io) {}

std::string Router::validate(const CommandCall& call) {
    for (const auto& [key, value] : call.options) {
        if (canonicalFlag(key).empty()) return "Unknown option: " + std::string(key.size() == 1 ? "-" : "--") + key;
        if (value) continue;
        if (key == "dir") return "Error: Directory argument is missing";
        if (key == "device") return "Error: Device directory argument is missing";
        if (key == "restore") return "Error: Export name argument is missing";
        if (key == "config") return "Error: Config file argument is missing";
    }
    if (!call.positionals.empty()) return "Unknown option: " + call.positionals.front();
    if (hasFlag(call, "restore") && hasFlag(call, "list-exports")) return "Error: --restore and --list-exports cannot be combined";
    return {};
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    auto call = parseArgs(args);
    call.io = &io_;

    std::optional<std::filesystem::path> cfgPath;
    if (const auto explicitCfg = optVal(call, "config")) cfgPath = *explicitCfg;
    else cfgPath = paths::findConfigPath();

    try {
        ConfigRegistry::init(cfgPath);
    } catch (const YAML::Exception& e) {
        return invalid("Failed to load config " + cfgPath->string() + ": " + e.what());
    } catch (const std::exception& e) {
        return invalid("Failed to load config: " + std::string(e.what()));
    }

    if (!Registry::isInitialized()) Registry::init(ConfigRegistry::get().logging);

    Registry::rcsync()->info(BANNER);
    Registry::rcsync()->info("RC-202 Sync Tool - Starting");
    Registry::rcsync()->info(BANNER);

    if (const auto err = validate(call); !err.empty()) return usageError(err);
    if (hasFlag(call, "help")) return usage();

    try {
        auto result = dispatch(call);
        if (result.exit_code == 0) {
            Registry::rcsync()->info(BANNER);
            Registry::rcsync()->info("RC-202 Sync Tool - Completed");
            Registry::rcsync()->info(BANNER);
        }
        return result;
    } catch (const Error& e) {
        Registry::rcsync()->error("{}", e.what());
        if (e.kind() == ErrorKind::DeviceNotConnected)
            Registry::rcsync()->info("Please connect your BOSS RC-202 Loop Station via USB and try again.");
        return {1, "", ""};
    } catch (const std::exception& e) {
        Registry::rcsync()->error("Aborted: {}", e.what());
        return {1, "", ""};
    }
}

CommandResult Router::dispatch(const CommandCall& call) const {
    const auto& cfg = ConfigRegistry::get();

    auto backupDir = optVal(call, "dir");
    if (!backupDir) backupDir = envVal({"RC_BACKUP_DIR"});
    if (!backupDir && !cfg.backup.dir.empty()) backupDir = cfg.backup.dir.string();
    if (!backupDir) return usageError("Please select a backup destination with `--dir` (or set RC_BACKUP_DIR)");

    auto deviceDir = optVal(call, "device");
    if (!deviceDir) deviceDir = envVal({"RC_DEVICE_DIR"});
    if (!deviceDir) deviceDir = cfg.device.root.string();

    const auto layout = model::Layout::from(cfg, *deviceDir, *backupDir);

    if (hasFlag(call, "list-exports")) return handle_list_exports(call, layout);

    // Preconditions that fail must leave the backup root alone.
    const bool restoring = hasFlag(call, "restore");
    if (!restoring && !fs::ops::isDir(layout.deviceRoot)) return handle_sync(call, layout);

    if (restoring) {
        const auto name = optVal(call, "restore").value_or("");
        if (!Resolver::isValidExportName(name) || !fs::ops::isDir(layout.exportDir(name)))
            throw Error(ErrorKind::ExportNotFound, "Export not found: " + layout.exportDir(name).string());
    }

    prepareBackupRoot(layout);

    std::optional<Lock> lock;
    if (cfg.sync.lock_backup_dir) lock.emplace(layout.backupRoot);

    return restoring ? handle_restore(call, layout) : handle_sync(call, layout);
}

void Router::prepareBackupRoot(const model::Layout& layout) {
    const auto& root = layout.backupRoot;

    if (!fs::ops::isDir(root)) {
        Registry::rcsync()->info("Creating backup directory: {}", root.string());
        try {
            fs::ops::mkdir(root);
        } catch (const std::filesystem::filesystem_error& e) {
            throw Error(ErrorKind::BackupDirUnwritable, "Failed to create backup directory: " + std::string(e.what()));
        }
        Registry::rcsync()->info("[✓] Backup directory created successfully");
    } else {
        Registry::rcsync()->info("Backup directory already exists: {}", root.string());
    }

    const auto logFile = root / ConfigRegistry::get().backup.log_file;
    const bool fresh = !fs::ops::isFile(logFile);
    try {
        Registry::attachFile(logFile);
    } catch (const spdlog::spdlog_ex& e) {
        throw Error(ErrorKind::BackupDirUnwritable, "Cannot open log file " + logFile.string() + ": " + e.what());
    }
    if (fresh) Registry::rcsync()->info("Created log file: {}", logFile.string());
}
