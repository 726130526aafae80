#pragma once

#include <filesystem>
#include <optional>

namespace rcs::paths {

// Resolves the config file location: RCSYNC_CONFIG, then
// $XDG_CONFIG_HOME/rcsync/config.yaml, then ~/.config/rcsync/config.yaml.
// Returns nullopt when none of them exists.
std::optional<std::filesystem::path> findConfigPath();

}
