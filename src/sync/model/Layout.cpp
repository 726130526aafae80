#include "sync/model/Layout.hpp"
#include "bank/Slot.hpp"
#include "config/Config.hpp"
#include "util/timestamp.hpp"

using namespace rcs::sync::model;

Layout Layout::from(const config::Config& cfg, std::filesystem::path deviceRoot, std::filesystem::path backupRoot) {
    Layout layout;
    layout.deviceRoot = std::move(deviceRoot);
    layout.backupRoot = std::move(backupRoot);
    layout.extension = cfg.device.track_extension;
    layout.exportsDir = cfg.backup.exports_dir;
    return layout;
}

std::filesystem::path Layout::bankDir(const unsigned int bank) const {
    return backupRoot / rcs::bank::bankDirName(bank);
}

std::string Layout::defaultExportName(const unsigned int bank) {
    return util::getDate() + "_" + rcs::bank::bankDirName(bank);
}
