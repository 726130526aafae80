#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace rcs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["device"]) YAML::convert<DeviceConfig>::decode(node, cfg.device);
    if (auto node = root["backup"]) YAML::convert<BackupConfig>::decode(node, cfg.backup);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.device.track_extension.empty())
        throw std::runtime_error("device.track_extension must not be empty in " + path.string());
    if (cfg.sync.signature_prefix_bytes == 0)
        throw std::runtime_error("sync.signature_prefix_bytes must be greater than zero in " + path.string());

    return cfg;
}

}
