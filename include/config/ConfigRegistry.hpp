#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>

namespace rcs::config {

class ConfigRegistry {
public:
    // Loads the file at path, or keeps the defaults when path is empty.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static void init(Config config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
};

} // namespace rcs::config
