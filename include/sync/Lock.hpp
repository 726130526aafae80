#pragma once

#include <filesystem>

namespace rcs::sync {

// Advisory flock on <backupRoot>/.rcsync.lock held for the lifetime of the object.
// A second instance against the same backup root fails with BackupDirLocked.
class Lock {
public:
    explicit Lock(const std::filesystem::path& backupRoot);
    ~Lock();

    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    static constexpr const auto* FILE_NAME = ".rcsync.lock";

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

}
