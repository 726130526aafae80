#include "config/paths.hpp"

#include <cstdlib>

namespace rcs::paths {

static bool isFile(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

std::optional<std::filesystem::path> findConfigPath() {
    if (const char* env = std::getenv("RCSYNC_CONFIG"); env && *env) return std::filesystem::path(env);

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        const auto p = std::filesystem::path(xdg) / "rcsync" / "config.yaml";
        if (isFile(p)) return p;
    }

    if (const char* home = std::getenv("HOME"); home && *home) {
        const auto p = std::filesystem::path(home) / ".config" / "rcsync" / "config.yaml";
        if (isFile(p)) return p;
    }

    return std::nullopt;
}

}
