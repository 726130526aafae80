#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rcs::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult usage();

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

// First environment variable in names that is set and non-empty.
std::optional<std::string> envVal(const std::vector<std::string>& names);

}
