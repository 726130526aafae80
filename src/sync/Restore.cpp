#include "sync/Restore.hpp"
#include "sync/Device.hpp"
#include "sync/Error.hpp"
#include "sync/Resolver.hpp"
#include "bank/Slot.hpp"
#include "fs/ops.hpp"
#include "shell/IO.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace rcs::sync;
using namespace rcs::sync::model;
using namespace rcs::bank;
using namespace rcs::log;

Restore::Restore(Layout layout, shell::IO& io)
    : layout_(std::move(layout)), io_(io) {}

std::vector<std::filesystem::path> Restore::snapshotTracks(const std::string& exportName) const {
    if (!Resolver::isValidExportName(exportName))
        throw Error(ErrorKind::ExportNotFound, "Invalid export name: '" + exportName + "'");

    const auto dir = layout_.exportDir(exportName);
    if (!fs::ops::isDir(dir))
        throw Error(ErrorKind::ExportNotFound, "Export not found: " + dir.string());

    auto tracks = fs::ops::listTrackFiles(dir, layout_.extension);
    if (tracks.empty())
        throw Error(ErrorKind::ExportNotFound, "Export " + exportName + " contains no ." + layout_.extension + " files");

    return tracks;
}

unsigned int Restore::targetBank(const std::vector<std::filesystem::path>& tracks) {
    if (tracks.empty()) throw Error(ErrorKind::AmbiguousBank, "Cannot determine bank of an empty export");

    const auto name = tracks.front().stem().string();
    const auto slot = Slot::tryParse(name);
    if (!slot) throw Error(ErrorKind::AmbiguousBank, "Cannot determine bank from track name '" + name + "'");

    const auto bank = slot->bank();
    if (!isValidBank(bank))
        throw Error(ErrorKind::AmbiguousBank, fmt::format("Track {} maps to bank {}, outside 1..{}", name, bank, BANK_COUNT));

    return bank;
}

RestoreResult Restore::run(const std::string& exportName) const {
    const auto tracks = snapshotTracks(exportName);

    RestoreResult result;
    result.bank = targetBank(tracks);

    requireDevice(layout_);

    const auto bankName = bankDirName(result.bank);
    Registry::sync()->info("Restoring export {} ({} files) to {} on the device", exportName, tracks.size(), bankName);

    if (!fs::ops::isDir(layout_.bankDir(result.bank))) {
        const auto question = fmt::format(
            "{} has never been synced; restoring may overwrite recordings that have no backup. Continue?", bankName);
        if (!io_.confirm(question, true)) {
            Registry::sync()->warn("Restore of {} cancelled", exportName);
            result.cancelled = true;
            return result;
        }
    }

    for (const auto& track : tracks) {
        const auto slot = track.stem().string();
        const auto parsed = Slot::tryParse(slot);
        if (!parsed) {
            Registry::sync()->error("Skipping {}: not a slot track", track.filename().string());
            ++result.errored;
            continue;
        }
        if (parsed->bank() != result.bank)
            Registry::sync()->warn("{} does not belong to {}, restoring it to its own slot", track.filename().string(), bankName);

        Registry::sync()->info("Restoring: {}", track.filename().string());

        std::error_code ec;
        if (!fs::ops::copyFile(track, layout_.deviceFile(slot), ec)) {
            Registry::sync()->error("Failed to restore {}: {}", track.filename().string(), ec.message());
            ++result.errored;
            continue;
        }

        ++result.restored;
    }

    return result;
}

std::vector<ExportInfo> rcs::sync::listExports(const Layout& layout) {
    std::vector<ExportInfo> out;

    for (const auto& name : rcs::fs::ops::listNames(layout.exportsRoot(), rcs::fs::ops::EntryType::Directory)) {
        ExportInfo info;
        info.name = name;

        const auto tracks = rcs::fs::ops::listTrackFiles(layout.exportDir(name), layout.extension);
        info.tracks = tracks.size();
        if (!tracks.empty()) {
            if (const auto slot = Slot::tryParse(tracks.front().stem().string()); slot && isValidBank(slot->bank()))
                info.bank = slot->bank();
        }

        out.push_back(std::move(info));
    }

    return out;
}
