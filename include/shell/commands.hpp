#pragma once

#include "shell/types.hpp"

namespace rcs::sync::model {
struct Layout;
}

namespace rcs::shell {

// Handlers run after arguments, config, logging and the backup root are set up.
CommandResult handle_sync(const CommandCall& call, const sync::model::Layout& layout);
CommandResult handle_restore(const CommandCall& call, const sync::model::Layout& layout);
CommandResult handle_list_exports(const CommandCall& call, const sync::model::Layout& layout);

}
