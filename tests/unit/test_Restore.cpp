#include "support/ScriptedIO.hpp"
#include "support/TempTree.hpp"

#include "sync/Error.hpp"
#include "sync/Restore.hpp"

#include <functional>

using namespace rcs::sync;
using rcs::test::ScriptedIO;
using rcs::test::TempTree;

class RestoreTest : public TempTree {
protected:
    void exportTrack(const std::string& exportName, const std::string& file, const std::string& content) const {
        writeFile(layout.exportDir(exportName) / file, content);
    }

    static ErrorKind kindOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const Error& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected rcs::sync::Error";
        return ErrorKind::CopyFailed;
    }
};

TEST_F(RestoreTest, RestoresSnapshotOntoDevice) {
    exportTrack("snap", "009_1.WAV", "nine");
    exportTrack("snap", "010_2.WAV", "ten");
    std::filesystem::create_directories(layout.bankDir(2));
    deviceTrack("009_1", "overwritten");

    ScriptedIO io;
    const auto r = Restore(layout, io).run("snap");

    EXPECT_EQ(r.bank, 2u);
    EXPECT_EQ(r.restored, 2u);
    EXPECT_EQ(r.errored, 0u);
    EXPECT_FALSE(r.cancelled);
    EXPECT_TRUE(io.prompts.empty());
    EXPECT_EQ(readFile(layout.deviceFile("009_1")), "nine");
    EXPECT_EQ(readFile(layout.deviceFile("010_2")), "ten");
}

TEST_F(RestoreTest, MissingExportIsNotFound) {
    ScriptedIO io;
    EXPECT_EQ(kindOf([&] { (void)Restore(layout, io).run("nope"); }), ErrorKind::ExportNotFound);
}

TEST_F(RestoreTest, ExportWithoutTracksIsNotFound) {
    exportTrack("snap", "readme.txt", "x");
    ScriptedIO io;
    EXPECT_EQ(kindOf([&] { (void)Restore(layout, io).run("snap"); }), ErrorKind::ExportNotFound);
}

TEST_F(RestoreTest, PathLikeNameIsNotFound) {
    ScriptedIO io;
    EXPECT_EQ(kindOf([&] { (void)Restore(layout, io).run("../device"); }), ErrorKind::ExportNotFound);
}

TEST_F(RestoreTest, UnparseableFirstTrackIsAmbiguous) {
    exportTrack("snap", "000_take.WAV", "x");
    exportTrack("snap", "001_1.WAV", "x");
    ScriptedIO io;
    EXPECT_EQ(kindOf([&] { (void)Restore(layout, io).run("snap"); }), ErrorKind::AmbiguousBank);
}

TEST_F(RestoreTest, DisconnectedDeviceFailsWithoutWriting) {
    exportTrack("snap", "001_1.WAV", "x");
    std::filesystem::remove_all(layout.deviceRoot);

    ScriptedIO io;
    EXPECT_EQ(kindOf([&] { (void)Restore(layout, io).run("snap"); }), ErrorKind::DeviceNotConnected);
    EXPECT_FALSE(std::filesystem::exists(layout.deviceRoot));
}

TEST_F(RestoreTest, NeverSyncedBankAsksFirst) {
    exportTrack("snap", "001_1.WAV", "x");

    ScriptedIO decline({"n"});
    const auto r = Restore(layout, decline).run("snap");
    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(r.restored, 0u);
    EXPECT_FALSE(std::filesystem::exists(layout.deviceFile("001_1")));

    ScriptedIO accept({"y"});
    const auto ok = Restore(layout, accept).run("snap");
    EXPECT_FALSE(ok.cancelled);
    EXPECT_EQ(ok.restored, 1u);
}

TEST_F(RestoreTest, NonSlotFilesCountAsErrors) {
    exportTrack("snap", "001_1.WAV", "x");
    exportTrack("snap", "zz_extra.WAV", "x");
    std::filesystem::create_directories(layout.bankDir(1));

    ScriptedIO io;
    const auto r = Restore(layout, io).run("snap");
    EXPECT_EQ(r.restored, 1u);
    EXPECT_EQ(r.errored, 1u);
}

TEST_F(RestoreTest, ListExports) {
    exportTrack("a_snap", "017_1.WAV", "x");
    exportTrack("a_snap", "018_1.WAV", "x");
    exportTrack("b_snap", "notes.WAV", "x");

    const auto list = listExports(layout);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].name, "a_snap");
    EXPECT_EQ(list[0].bank, 3u);
    EXPECT_EQ(list[0].tracks, 2u);
    EXPECT_FALSE(list[1].bank.has_value());
}
