#include "sync/Transformer.hpp"
#include "bank/SlotIndex.hpp"
#include "fs/ops.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <set>

using namespace rcs::sync;
using namespace rcs::sync::model;
using namespace rcs::bank;
using namespace rcs::log;

Transformer::Transformer(Layout layout, Comparator comparator)
    : layout_(std::move(layout)), comparator_(comparator) {}

BankResult Transformer::run(const ChangeSet& cs, const SlotIndex& index, const Decision& decision) const {
    switch (decision.action) {
        case Action::Apply: return apply(cs, index);
        case Action::Export: return exportThenApply(cs, index, decision.exportName.value_or(""));
        case Action::Revert: return revert(cs, index);
        case Action::Skip:
        case Action::None:
            break;
    }
    return {};
}

BankResult Transformer::apply(const ChangeSet& cs, const SlotIndex& index) const {
    BankResult result;
    const auto bankName = bankDirName(cs.bank);

    for (const auto& slot : index.slotsIn(cs.bank)) {
        const auto src = layout_.deviceFile(slot);
        if (!fs::ops::isFile(src)) continue;

        ++result.considered;

        const auto dst = layout_.backupFile(cs.bank, slot);
        if (!comparator_.differs(src, dst)) {
            ++result.skipped;
            continue;
        }

        Registry::sync()->info("Copying: {} to {}", layout_.trackFileName(slot), bankName);

        std::error_code ec;
        if (!fs::ops::copyFile(src, dst, ec)) {
            Registry::sync()->error("Failed to copy {}: {}", layout_.trackFileName(slot), ec.message());
            ++result.errored;
            continue;
        }

        ++result.copied;
    }

    if (!cs.deleted.empty()) removeOrphans(cs.bank, result);

    return result;
}

void Transformer::removeOrphans(const unsigned int bank, BankResult& result) const {
    const auto bankName = bankDirName(bank);

    for (const auto& file : fs::ops::listTrackFiles(layout_.bankDir(bank), layout_.extension)) {
        const auto name = file.stem().string();
        const auto slot = Slot::tryParse(name);
        if (!slot || slot->bank() != bank) continue;
        if (fs::ops::isFile(layout_.deviceFile(name))) continue;

        Registry::sync()->info("Deleting: {} from {}", file.filename().string(), bankName);

        std::error_code ec;
        if (!fs::ops::removeFile(file, ec)) {
            Registry::sync()->error("Failed to delete {}: {}", file.filename().string(),
                                    ec ? ec.message() : "file vanished");
            ++result.errored;
            continue;
        }

        ++result.removed;
    }
}

std::string Transformer::uniqueExportName(const std::string& requested) const {
    if (!fs::ops::isDir(layout_.exportDir(requested)) && !fs::ops::isFile(layout_.exportDir(requested))) return requested;

    const auto stamped = requested + "_" + util::getTimeOfDay();
    auto candidate = stamped;
    for (unsigned int n = 2; std::filesystem::exists(layout_.exportDir(candidate)); ++n)
        candidate = stamped + "_" + std::to_string(n);
    return candidate;
}

bool Transformer::snapshot(const unsigned int bank, const std::string& exportName, BankResult& result) const {
    const auto bankDir = layout_.bankDir(bank);
    const auto files = fs::ops::listNames(bankDir, fs::ops::EntryType::RegularFile);

    if (files.empty()) {
        Registry::sync()->warn("No files to export for {}", bankDirName(bank));
        return true;
    }

    const auto name = uniqueExportName(exportName);
    const auto target = layout_.exportDir(name);

    Registry::sync()->info("Exporting {} ({} files) to {}", bankDirName(bank), files.size(), target.string());

    std::error_code ec;
    const auto copied = fs::ops::copyFiles(bankDir, target, ec);
    if (ec) {
        Registry::sync()->error("Export of {} failed after {} of {} files: {}", bankDirName(bank), copied, files.size(), ec.message());
        ++result.errored;

        std::error_code rmEc;
        std::filesystem::remove_all(target, rmEc);
        if (rmEc) Registry::sync()->error("Failed to remove incomplete export {}: {}", target.string(), rmEc.message());
        return false;
    }

    Registry::sync()->info("[✓] Exported {} to {}", bankDirName(bank), name);
    return true;
}

BankResult Transformer::exportThenApply(const ChangeSet& cs, const SlotIndex& index, const std::string& exportName) const {
    BankResult result;

    const auto name = exportName.empty() ? Layout::defaultExportName(cs.bank) : exportName;
    if (!snapshot(cs.bank, name, result)) {
        Registry::sync()->error("Leaving {} untouched because the export failed", bankDirName(cs.bank));
        return result;
    }

    std::error_code ec;
    if (!fs::ops::recreateDir(layout_.bankDir(cs.bank), ec)) {
        Registry::sync()->error("Failed to reset {}: {}", bankDirName(cs.bank), ec.message());
        ++result.errored;
        return result;
    }

    const auto applied = apply(cs, index);
    result.considered += applied.considered;
    result.copied += applied.copied;
    result.skipped += applied.skipped;
    result.removed += applied.removed;
    result.errored += applied.errored;
    return result;
}

BankResult Transformer::revert(const ChangeSet& cs, const SlotIndex& index) const {
    BankResult result;
    std::set<std::string> backedUp;

    for (const auto& file : fs::ops::listTrackFiles(layout_.bankDir(cs.bank), layout_.extension)) {
        const auto name = file.stem().string();
        const auto slot = Slot::tryParse(name);
        if (!slot || slot->bank() != cs.bank) continue;

        backedUp.insert(name);
        ++result.considered;

        Registry::sync()->info("Reverting: {} on device", file.filename().string());

        std::error_code ec;
        if (!fs::ops::copyFile(file, layout_.deviceFile(name), ec)) {
            Registry::sync()->error("Failed to revert {}: {}", file.filename().string(), ec.message());
            ++result.errored;
            continue;
        }

        ++result.copied;
    }

    for (const auto& slot : index.slotsIn(cs.bank)) {
        if (backedUp.contains(slot)) continue;

        const auto target = layout_.deviceFile(slot);
        if (!fs::ops::isFile(target)) continue;

        Registry::sync()->info("Deleting: {} from device", layout_.trackFileName(slot));

        std::error_code ec;
        if (!fs::ops::removeFile(target, ec)) {
            Registry::sync()->error("Failed to delete {} from device: {}", layout_.trackFileName(slot),
                                    ec ? ec.message() : "file vanished");
            ++result.errored;
            continue;
        }

        ++result.removed;
    }

    return result;
}
