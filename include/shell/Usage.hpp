#pragma once

#include "shell/types.hpp"

#include <string>
#include <vector>

namespace rcs::shell {

struct FlagUsage {
    std::string name;       // canonical long name
    char shortName = '\0';
    std::string valueName;  // empty for switches
    std::string description;
};

const std::vector<FlagUsage>& flags();

// Canonical long name for a long or short flag, empty when unknown.
std::string canonicalFlag(const std::string& key);

std::string usageText();

// Tokenizes argv (without argv[0]) and maps short flags to their long names.
CommandCall parseArgs(const std::vector<std::string>& args);

}
