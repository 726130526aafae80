#include "fs/ops.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace rcs::log;

namespace rcs::fs::ops {

static bool matches(const std::filesystem::directory_entry& entry, const EntryType type, std::error_code& ec) {
    switch (type) {
        case EntryType::Directory: return entry.is_directory(ec);
        case EntryType::RegularFile: return entry.is_regular_file(ec);
        case EntryType::Any: return true;
    }
    return false;
}

std::vector<std::string> listNames(const std::filesystem::path& dir, const EntryType type) {
    std::vector<std::string> names;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory)
            Registry::fs()->warn("Cannot list {}: {}", dir.string(), ec.message());
        return names;
    }

    for (const auto& entry : it) {
        std::error_code typeEc;
        if (matches(entry, type, typeEc)) names.push_back(entry.path().filename().string());
    }

    std::ranges::sort(names);
    return names;
}

bool isTrackFile(const std::filesystem::path& p, const std::string_view ext) {
    const auto e = p.extension().string();
    return e.size() == ext.size() + 1 && std::string_view(e).substr(1) == ext;
}

std::vector<std::filesystem::path> listTrackFiles(const std::filesystem::path& dir, const std::string_view ext) {
    std::vector<std::filesystem::path> files;
    for (const auto& name : listNames(dir, EntryType::RegularFile)) {
        const auto p = dir / name;
        if (isTrackFile(p, ext)) files.push_back(p);
    }
    return files;
}

bool isFile(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

bool isDir(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_directory(p, ec);
}

void mkdir(const std::filesystem::path& dir) {
    if (isDir(dir)) return;
    std::filesystem::create_directories(dir);
    Registry::fs()->debug("Created directory {}", dir.string());
}

bool copyFile(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) {
    ec.clear();
    if (to.has_parent_path() && !isDir(to.parent_path())) {
        std::filesystem::create_directories(to.parent_path(), ec);
        if (ec) return false;
    }
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    return !ec;
}

size_t copyFiles(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) {
    ec.clear();
    std::filesystem::create_directories(to, ec);
    if (ec) return 0;

    size_t copied = 0;
    for (const auto& name : listNames(from, EntryType::RegularFile)) {
        if (!copyFile(from / name, to / name, ec)) return copied;
        ++copied;
    }
    return copied;
}

bool removeFile(const std::filesystem::path& p, std::error_code& ec) {
    ec.clear();
    const bool removed = std::filesystem::remove(p, ec);
    return removed && !ec;
}

bool recreateDir(const std::filesystem::path& dir, std::error_code& ec) {
    ec.clear();
    std::filesystem::remove_all(dir, ec);
    if (ec) return false;
    std::filesystem::create_directories(dir, ec);
    return !ec;
}

}
