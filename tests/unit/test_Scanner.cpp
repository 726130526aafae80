#include "support/TempTree.hpp"

#include "sync/Scanner.hpp"

using namespace rcs::sync;
using rcs::test::TempTree;

class ScannerTest : public TempTree {
protected:
    [[nodiscard]] Scanner scanner() const { return {layout, Comparator()}; }
};

TEST_F(ScannerTest, EmptyDeviceIsNoData) {
    const auto result = scanner().scan();
    EXPECT_TRUE(result.noData());
    EXPECT_TRUE(result.banks.empty());
}

TEST_F(ScannerTest, NonSlotEntriesAloneAreNoData) {
    writeFile(layout.deviceRoot / "notes" / "notes.WAV", "x");
    writeFile(layout.deviceRoot / "README.txt", "x");
    EXPECT_TRUE(scanner().scan().noData());
}

TEST_F(ScannerTest, FirstRunReportsOnlyAdditions) {
    deviceTrack("001_1", "one");
    deviceTrack("009_1", "nine");

    const auto result = scanner().scan();
    ASSERT_FALSE(result.noData());
    ASSERT_EQ(result.banks.size(), 8u);

    const auto& b1 = result.banks.at(1);
    EXPECT_TRUE(b1.onlyAdditions());
    EXPECT_EQ(b1.added, std::vector<std::string>{"001_1"});

    EXPECT_EQ(result.banks.at(2).added, std::vector<std::string>{"009_1"});
    EXPECT_FALSE(result.banks.at(3).hasChanges());
}

TEST_F(ScannerTest, ClassifiesAddedModifiedDeleted) {
    deviceTrack("001_1", "same");
    backupTrack(1, "001_1", "same");

    deviceTrack("002_1", "new take");
    backupTrack(1, "002_1", "old take");

    deviceTrack("003_1", "fresh");

    backupTrack(1, "004_1", "gone from device");

    const auto cs = scanner().scan().banks.at(1);
    EXPECT_EQ(cs.added, std::vector<std::string>{"003_1"});
    EXPECT_EQ(cs.modified, std::vector<std::string>{"002_1"});
    EXPECT_EQ(cs.deleted, std::vector<std::string>{"004_1"});
    EXPECT_EQ(cs.size(), 3u);
}

TEST_F(ScannerTest, SlotDirectoryWithoutTrackIsIgnored) {
    std::filesystem::create_directories(layout.deviceSlotDir("005_1"));
    const auto result = scanner().scan();
    EXPECT_FALSE(result.noData());
    EXPECT_FALSE(result.banks.at(1).hasChanges());
}

TEST_F(ScannerTest, BackupFilesOfOtherBanksAreNotDeletions) {
    deviceTrack("001_1", "x");
    backupTrack(1, "001_1", "x");
    backupTrack(1, "017_1", "misplaced");
    backupTrack(1, "notes", "junk");

    EXPECT_FALSE(scanner().scan().banks.at(1).hasChanges());
}

TEST_F(ScannerTest, ExtensionMatchIsExact) {
    deviceTrack("001_1", "x");
    backupTrack(1, "001_1", "x");
    writeFile(layout.bankDir(1) / "002_1.wav", "lower");

    EXPECT_FALSE(scanner().scan().banks.at(1).hasChanges());
}

TEST_F(ScannerTest, LowercaseBackupIsNotACounterpart) {
    deviceTrack("001_1", "new");
    writeFile(layout.bankDir(1) / "001_1.wav", "stale");

    const auto cs = scanner().scan().banks.at(1);
    EXPECT_EQ(cs.added, std::vector<std::string>{"001_1"});
    EXPECT_TRUE(cs.modified.empty());
    EXPECT_TRUE(cs.deleted.empty());
}
