#include "shell/commands.hpp"
#include "shell/helpers.hpp"
#include "sync/Controller.hpp"
#include "sync/Device.hpp"
#include "sync/model/Layout.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

using namespace rcs::shell;
using namespace rcs::sync;
using namespace rcs::config;
using namespace rcs::log;

CommandResult rcs::shell::handle_sync(const CommandCall& call, const model::Layout& layout) {
    if (!call.io) return invalid("sync: an interactive terminal is required");

    if (!isDeviceConnected(layout)) {
        Registry::rcsync()->error("BOSS RC-202 not found at {}", layout.deviceRoot.string());
        Registry::rcsync()->info("Please connect your BOSS RC-202 Loop Station via USB and try again.");
        return {1, "", ""};
    }
    Registry::rcsync()->info("[✓] BOSS RC-202 detected at {}", layout.deviceRoot.string());

    const Controller controller(layout, *call.io, ConfigRegistry::get().sync.signature_prefix_bytes);
    const auto report = controller.run();

    if (report.noData) {
        Registry::rcsync()->warn("Synchronization process encountered errors");
        return {1, "", ""};
    }

    return {0, "", ""};
}
