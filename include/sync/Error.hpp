#pragma once

#include <stdexcept>
#include <string>

namespace rcs::sync {

enum class ErrorKind {
    DeviceNotConnected,
    BackupDirUnwritable,
    BackupDirLocked,
    MalformedSlotName,
    CopyFailed,
    ExportNotFound,
    AmbiguousBank,
    InvalidPromptInput,
};

std::string to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}
