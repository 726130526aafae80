#include "shell/commands.hpp"
#include "shell/helpers.hpp"
#include "sync/Restore.hpp"
#include "sync/model/Layout.hpp"

#include <fmt/format.h>

using namespace rcs::shell;
using namespace rcs::sync;

CommandResult rcs::shell::handle_list_exports(const CommandCall&, const model::Layout& layout) {
    const auto exports = listExports(layout);
    if (exports.empty()) return ok("No exports found in " + layout.exportsRoot().string() + "\n");

    std::string out = fmt::format("{:<32} {:<8} {}\n", "NAME", "BANK", "TRACKS");
    for (const auto& e : exports)
        out += fmt::format("{:<32} {:<8} {}\n", e.name, e.bank ? "bank_" + std::to_string(*e.bank) : "?", e.tracks);

    return ok(out);
}
