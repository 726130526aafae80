#pragma once

#include "shell/types.hpp"

#include <string>
#include <vector>

namespace rcs::sync::model {
struct Layout;
}

namespace rcs::shell {

class Router {
public:
    explicit Router(IO& io);

    // argv without the program name. Loads config, starts logging, checks
    // preconditions and runs the selected command.
    CommandResult execute(const std::vector<std::string>& args) const;

private:
    IO& io_;

    static std::string validate(const CommandCall& call);
    static void prepareBackupRoot(const sync::model::Layout& layout);
    CommandResult dispatch(const CommandCall& call) const;
};

}
