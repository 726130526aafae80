#include "sync/Scanner.hpp"
#include "fs/ops.hpp"
#include "log/Registry.hpp"

using namespace rcs::sync;
using namespace rcs::sync::model;
using namespace rcs::bank;
using namespace rcs::log;

Scanner::Scanner(Layout layout, Comparator comparator)
    : layout_(std::move(layout)), comparator_(comparator) {}

SlotIndex Scanner::indexDevice() const {
    return SlotIndex::fromDevice(layout_.deviceRoot);
}

ScanResult Scanner::scan() const {
    ScanResult result;
    result.index = indexDevice();
    if (result.noData()) return result;

    for (unsigned int bank = 1; bank <= BANK_COUNT; ++bank)
        result.banks.emplace(bank, scanBank(bank, result.index));

    return result;
}

ChangeSet Scanner::scanBank(const unsigned int bank, const SlotIndex& index) const {
    ChangeSet cs;
    cs.bank = bank;

    for (const auto& file : fs::ops::listTrackFiles(layout_.bankDir(bank), layout_.extension)) {
        const auto name = file.stem().string();
        const auto slot = Slot::tryParse(name);
        if (!slot) {
            Registry::sync()->debug("Ignoring {} in {}: not a slot name", file.filename().string(), bankDirName(bank));
            continue;
        }
        if (slot->bank() != bank) continue;
        if (!fs::ops::isFile(layout_.deviceFile(name))) cs.deleted.push_back(name);
    }

    for (const auto& name : index.slotsIn(bank)) {
        const auto deviceFile = layout_.deviceFile(name);
        if (!fs::ops::isFile(deviceFile)) continue;

        const auto backupFile = layout_.backupFile(bank, name);
        if (!fs::ops::isFile(backupFile)) cs.added.push_back(name);
        else if (comparator_.differs(deviceFile, backupFile)) cs.modified.push_back(name);
    }

    if (cs.hasChanges())
        Registry::sync()->debug("{}: {} new, {} modified, {} deleted", bankDirName(bank),
                                cs.added.size(), cs.modified.size(), cs.deleted.size());

    return cs;
}
