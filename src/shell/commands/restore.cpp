#include "shell/commands.hpp"
#include "shell/helpers.hpp"
#include "sync/Restore.hpp"
#include "sync/model/Layout.hpp"
#include "log/Registry.hpp"

using namespace rcs::shell;
using namespace rcs::sync;
using namespace rcs::log;

CommandResult rcs::shell::handle_restore(const CommandCall& call, const model::Layout& layout) {
    const auto name = optVal(call, "restore");
    if (!name || name->empty()) return invalid("Error: Export name argument is missing");
    if (!call.io) return invalid("restore: an interactive terminal is required");

    const Restore restore(layout, *call.io);
    const auto result = restore.run(*name);

    if (result.cancelled) return {0, "", ""};

    Registry::rcsync()->info("Restore of {} to {} finished", *name, "bank_" + std::to_string(result.bank));
    Registry::rcsync()->info("Files restored: {}", result.restored);

    if (result.errored > 0) {
        Registry::rcsync()->warn("Files with errors: {}", result.errored);
        return {1, "", ""};
    }

    Registry::rcsync()->info("[✓] Restore complete!");
    return {0, "", ""};
}
