#pragma once

#include "sync/model/Layout.hpp"
#include "sync/model/Report.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rcs::shell {
struct IO;
}

namespace rcs::sync {

struct ExportInfo {
    std::string name;
    std::optional<unsigned int> bank;  // nullopt when the first track name is not a slot
    size_t tracks = 0;
};

// Copies an export snapshot back onto the device.
class Restore {
public:
    Restore(model::Layout layout, shell::IO& io);

    // Throws sync::Error: ExportNotFound, AmbiguousBank, DeviceNotConnected.
    model::RestoreResult run(const std::string& exportName) const;

    // Bank of the first track file. Throws sync::Error(AmbiguousBank).
    static unsigned int targetBank(const std::vector<std::filesystem::path>& tracks);

private:
    model::Layout layout_;
    shell::IO& io_;

    [[nodiscard]] std::vector<std::filesystem::path> snapshotTracks(const std::string& exportName) const;
};

// Every snapshot under exports/, sorted by name.
std::vector<ExportInfo> listExports(const model::Layout& layout);

}
