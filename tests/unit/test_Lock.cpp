#include "support/TempTree.hpp"

#include "sync/Error.hpp"
#include "sync/Lock.hpp"

using namespace rcs::sync;
using rcs::test::TempTree;

class LockTest : public TempTree {};

TEST_F(LockTest, SecondHolderIsRefused) {
    std::filesystem::create_directories(layout.backupRoot);
    const Lock first(layout.backupRoot);
    EXPECT_TRUE(std::filesystem::exists(first.path()));

    try {
        const Lock second(layout.backupRoot);
        FAIL() << "expected BackupDirLocked";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BackupDirLocked);
    }
}

TEST_F(LockTest, ReleasedOnDestruction) {
    std::filesystem::create_directories(layout.backupRoot);
    { const Lock first(layout.backupRoot); }
    EXPECT_NO_THROW(Lock again(layout.backupRoot));
}

TEST_F(LockTest, MissingRootIsUnwritable) {
    try {
        const Lock lock(layout.backupRoot / "missing");
        FAIL() << "expected BackupDirUnwritable";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BackupDirUnwritable);
    }
}
