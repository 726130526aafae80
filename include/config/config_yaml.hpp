#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rcs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DeviceConfig> {
    static Node encode(const DeviceConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["track_extension"] = rhs.track_extension;
        return node;
    }

    static bool decode(const Node& node, DeviceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/Volumes/BOSS_RC-202/ROLAND/WAVE");
        rhs.track_extension = node["track_extension"].as<std::string>("WAV");
        return true;
    }
};

template<>
struct convert<BackupConfig> {
    static Node encode(const BackupConfig& rhs) {
        Node node;
        node["dir"] = rhs.dir.string();
        node["exports_dir"] = rhs.exports_dir;
        node["log_file"] = rhs.log_file;
        return node;
    }

    static bool decode(const Node& node, BackupConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dir = node["dir"].as<std::string>("");
        rhs.exports_dir = node["exports_dir"].as<std::string>("exports");
        rhs.log_file = node["log_file"].as<std::string>("sync_log.txt");
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["signature_prefix_bytes"] = rhs.signature_prefix_bytes;
        node["lock_backup_dir"] = rhs.lock_backup_dir;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.signature_prefix_bytes = node["signature_prefix_bytes"].as<uintmax_t>(DEFAULT_SIGNATURE_PREFIX_BYTES);
        rhs.lock_backup_dir = node["lock_backup_dir"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["rcsync"] = to_std_string(spdlog::level::to_string_view(rhs.rcsync));
        node["sync"]   = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["fs"]     = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["shell"]  = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.rcsync = spdlog::level::from_str(node["rcsync"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
