#include "shell/Usage.hpp"
#include "shell/Parser.hpp"
#include "shell/Token.hpp"

#include <fmt/format.h>

#include <unordered_set>

namespace rcs::shell {

const std::vector<FlagUsage>& flags() {
    static const std::vector<FlagUsage> table = {
        {"dir", 'd', "DIR", "Backup directory (overrides RC_BACKUP_DIR)"},
        {"device", '\0', "DIR", "Device WAVE directory (overrides RC_DEVICE_DIR)"},
        {"restore", 'r', "NAME", "Restore an export snapshot back onto the device"},
        {"list-exports", 'l', "", "List export snapshots in the backup directory"},
        {"config", 'c', "FILE", "Configuration file (overrides RCSYNC_CONFIG)"},
        {"help", 'h', "", "Show this help message"},
    };
    return table;
}

std::string canonicalFlag(const std::string& key) {
    for (const auto& f : flags()) {
        if (key == f.name) return f.name;
        if (key.size() == 1 && f.shortName != '\0' && key[0] == f.shortName) return f.name;
    }
    return {};
}

std::string usageText() {
    std::string out = "\nUsage: rcsync [OPTIONS]\nOptions:\n";
    for (const auto& f : flags()) {
        auto lhs = f.shortName ? fmt::format("-{}, --{}", f.shortName, f.name) : fmt::format("    --{}", f.name);
        if (!f.valueName.empty()) lhs += " " + f.valueName;
        out += fmt::format("  {:<24} {}\n", lhs, f.description);
    }
    out += "\n";
    return out;
}

CommandCall parseArgs(const std::vector<std::string>& args) {
    auto toks = tokenize(args);

    // Unknown flags keep their spelling so the caller can report them.
    for (auto& t : toks)
        if (t.type == TokenType::Flag)
            if (auto canonical = canonicalFlag(t.text); !canonical.empty()) t.text = std::move(canonical);

    std::unordered_set<std::string> valueFlags;
    for (const auto& f : flags())
        if (!f.valueName.empty()) valueFlags.insert(f.name);

    auto call = parseTokens(toks, valueFlags);
    call.name = "rcsync";
    return call;
}

}
