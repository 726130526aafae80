#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace rcs::config {

constexpr static uintmax_t DEFAULT_SIGNATURE_PREFIX_BYTES = 64 * 1024; // 64KiB, enough for WAV headers

struct DeviceConfig {
    std::filesystem::path root = "/Volumes/BOSS_RC-202/ROLAND/WAVE";
    std::string track_extension = "WAV";
};

struct BackupConfig {
    std::filesystem::path dir{};  // empty = must come from --dir or RC_BACKUP_DIR
    std::string exports_dir = "exports";
    std::string log_file = "sync_log.txt";
};

struct SyncConfig {
    uintmax_t signature_prefix_bytes = DEFAULT_SIGNATURE_PREFIX_BYTES;
    bool lock_backup_dir = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum rcsync = spdlog::level::info;  // Run banners and the final summary
    spdlog::level::level_enum sync   = spdlog::level::info;  // Per-file copy/delete, skipped banks
    spdlog::level::level_enum fs     = spdlog::level::info;  // Directory creation, low-level I/O failures
    spdlog::level::level_enum shell  = spdlog::level::info;  // Argument errors
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    DeviceConfig device;
    BackupConfig backup;
    SyncConfig sync;

    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace rcs::config
