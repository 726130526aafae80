#pragma once

#include "shell/IO.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rcs::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
    IO* io = nullptr;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;
    std::string stderr_text;
};

}
