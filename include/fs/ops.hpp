#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rcs::fs::ops {

enum class EntryType { Any, Directory, RegularFile };

// Sorted entry names directly under dir. A missing or unreadable dir yields an empty list.
std::vector<std::string> listNames(const std::filesystem::path& dir, EntryType type = EntryType::Any);

// Regular files under dir whose extension is exactly ext (without the dot), sorted.
// Counterpart paths are built with the same spelling, so "001_1.wav" is not a track of "WAV".
std::vector<std::filesystem::path> listTrackFiles(const std::filesystem::path& dir, std::string_view ext);

[[nodiscard]] bool isTrackFile(const std::filesystem::path& p, std::string_view ext);
[[nodiscard]] bool isFile(const std::filesystem::path& p);
[[nodiscard]] bool isDir(const std::filesystem::path& p);

// Throws std::filesystem::filesystem_error on failure.
void mkdir(const std::filesystem::path& dir);

// Copies one file, overwriting the target and creating its parent directory.
// Returns false and fills ec on failure.
bool copyFile(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec);

// Copies the regular files directly under from into to (created if absent).
// Returns the number of files copied; stops at the first failure and fills ec.
size_t copyFiles(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec);

bool removeFile(const std::filesystem::path& p, std::error_code& ec);

// Deletes dir with its contents and creates it again empty.
bool recreateDir(const std::filesystem::path& dir, std::error_code& ec);

}
