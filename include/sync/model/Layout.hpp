#pragma once

#include <filesystem>
#include <string>

namespace rcs::config {
struct Config;
}

namespace rcs::sync::model {

// Device and backup locations for one run. Every path the core touches is derived here.
struct Layout {
    std::filesystem::path deviceRoot;
    std::filesystem::path backupRoot;
    std::string extension = "WAV";
    std::string exportsDir = "exports";

    static Layout from(const config::Config& cfg, std::filesystem::path deviceRoot, std::filesystem::path backupRoot);

    [[nodiscard]] std::string trackFileName(const std::string& slot) const { return slot + "." + extension; }

    // device/<slot>/<slot>.WAV
    [[nodiscard]] std::filesystem::path deviceSlotDir(const std::string& slot) const { return deviceRoot / slot; }
    [[nodiscard]] std::filesystem::path deviceFile(const std::string& slot) const { return deviceSlotDir(slot) / trackFileName(slot); }

    // backup/bank_<N>/<slot>.WAV
    [[nodiscard]] std::filesystem::path bankDir(unsigned int bank) const;
    [[nodiscard]] std::filesystem::path backupFile(unsigned int bank, const std::string& slot) const { return bankDir(bank) / trackFileName(slot); }

    [[nodiscard]] std::filesystem::path exportsRoot() const { return backupRoot / exportsDir; }
    [[nodiscard]] std::filesystem::path exportDir(const std::string& name) const { return exportsRoot() / name; }

    // <date>_bank_<N>
    static std::string defaultExportName(unsigned int bank);
};

}
