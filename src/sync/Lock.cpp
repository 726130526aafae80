#include "sync/Lock.hpp"
#include "sync/Error.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace rcs::sync;

Lock::Lock(const std::filesystem::path& backupRoot) : path_(backupRoot / FILE_NAME) {
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0)
        throw Error(ErrorKind::BackupDirUnwritable,
                    "Cannot create lock file " + path_.string() + ": " + std::strerror(errno));

    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK)
            throw Error(ErrorKind::BackupDirLocked,
                        "Another rcsync run holds " + path_.string());
        throw std::runtime_error("Lock: flock failed on " + path_.string() + ": " + std::strerror(err));
    }
}

Lock::~Lock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}
