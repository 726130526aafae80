#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace rcs::config {

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    config_ = path ? loadConfig(*path) : Config{};
    initialized_ = true;
}

void ConfigRegistry::init(Config config) {
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace rcs::config
