#include "shell/helpers.hpp"
#include "shell/Usage.hpp"

#include <cstdlib>

namespace rcs::shell {

CommandResult invalid(std::string msg) {
    return {1, "", std::move(msg)};
}

CommandResult ok(std::string out) {
    return {0, std::move(out), ""};
}

CommandResult usage() {
    return ok(usageText());
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return true;
    return false;
}

std::optional<std::string> envVal(const std::vector<std::string>& names) {
    for (const auto& name : names)
        if (const char* v = std::getenv(name.c_str()); v && *v) return std::string(v);
    return std::nullopt;
}

}
