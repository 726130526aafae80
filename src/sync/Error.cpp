#include "sync/Error.hpp"

using namespace rcs::sync;

std::string rcs::sync::to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceNotConnected: return "DeviceNotConnected";
        case ErrorKind::BackupDirUnwritable: return "BackupDirUnwritable";
        case ErrorKind::BackupDirLocked: return "BackupDirLocked";
        case ErrorKind::MalformedSlotName: return "MalformedSlotName";
        case ErrorKind::CopyFailed: return "CopyFailed";
        case ErrorKind::ExportNotFound: return "ExportNotFound";
        case ErrorKind::AmbiguousBank: return "AmbiguousBank";
        case ErrorKind::InvalidPromptInput: return "InvalidPromptInput";
    }
    return "Unknown";
}

Error::Error(const ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}
