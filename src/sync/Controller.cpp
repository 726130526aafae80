#include "sync/Controller.hpp"
#include "bank/Slot.hpp"
#include "log/Registry.hpp"

using namespace rcs::sync;
using namespace rcs::sync::model;
using namespace rcs::bank;
using namespace rcs::log;

Controller::Controller(const Layout& layout, shell::IO& io, const uintmax_t prefixBytes)
    : layout_(layout),
      scanner_(layout, Comparator(prefixBytes)),
      resolver_(layout, io),
      transformer_(layout, Comparator(prefixBytes)) {}

SyncReport Controller::run() const {
    SyncReport report;

    Registry::sync()->info("Starting synchronization of {} files...", layout_.extension);

    const auto index = scanner_.indexDevice();
    if (index.empty()) {
        Registry::sync()->warn("No track directories found in {}", layout_.deviceRoot.string());
        report.noData = true;
        return report;
    }

    for (unsigned int bank = 1; bank <= BANK_COUNT; ++bank) {
        const auto cs = scanner_.scanBank(bank, index);
        const auto decision = resolver_.resolve(cs, index);

        if (decision.action == Action::None) continue;
        if (decision.action == Action::Skip) {
            ++report.banksSkipped;
            continue;
        }

        Registry::sync()->debug("{}: {}", bankDirName(bank), to_string(decision.action));
        report += transformer_.run(cs, index, decision);
        ++report.banksChanged;
    }

    logSummary(report);
    return report;
}

void Controller::logSummary(const SyncReport& report) {
    const auto log = Registry::rcsync();
    log->info("[✓] Synchronization complete!");
    log->info("Total files: {}", report.total);
    log->info("Files copied: {}", report.copied);
    log->info("Files skipped (not modified): {}", report.skipped);
    if (report.removed > 0) log->info("Files deleted: {}", report.removed);
    if (report.banksSkipped > 0) log->warn("Banks skipped: {}", report.banksSkipped);
    if (report.errored > 0) log->warn("Files with errors: {}", report.errored);
}
