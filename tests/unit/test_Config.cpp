#include "support/TempTree.hpp"

#include "config/Config.hpp"

#include <yaml-cpp/exceptions.h>

using namespace rcs::config;
using rcs::test::TempTree;

class ConfigTest : public TempTree {};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    const Config cfg;
    EXPECT_EQ(cfg.device.track_extension, "WAV");
    EXPECT_EQ(cfg.backup.exports_dir, "exports");
    EXPECT_EQ(cfg.backup.log_file, "sync_log.txt");
    EXPECT_EQ(cfg.sync.signature_prefix_bytes, 65536u);
    EXPECT_TRUE(cfg.sync.lock_backup_dir);
    EXPECT_TRUE(cfg.backup.dir.empty());
}

TEST_F(ConfigTest, LoadsAllSections) {
    writeFile(root / "config.yaml", R"(
device:
  root: /media/RC202/WAVE
  track_extension: wav
backup:
  dir: /srv/loops
  exports_dir: snapshots
sync:
  signature_prefix_bytes: 4096
  lock_backup_dir: false
logging:
  log_levels:
    console_log_level: warn
    subsystem_levels:
      sync: debug
)");

    const auto cfg = loadConfig(root / "config.yaml");
    EXPECT_EQ(cfg.device.root.string(), "/media/RC202/WAVE");
    EXPECT_EQ(cfg.device.track_extension, "wav");
    EXPECT_EQ(cfg.backup.dir.string(), "/srv/loops");
    EXPECT_EQ(cfg.backup.exports_dir, "snapshots");
    EXPECT_EQ(cfg.backup.log_file, "sync_log.txt");
    EXPECT_EQ(cfg.sync.signature_prefix_bytes, 4096u);
    EXPECT_FALSE(cfg.sync.lock_backup_dir);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::info);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fs, spdlog::level::info);
}

TEST_F(ConfigTest, ZeroPrefixIsRejected) {
    writeFile(root / "config.yaml", "sync:\n  signature_prefix_bytes: 0\n");
    EXPECT_THROW((void)loadConfig(root / "config.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW((void)loadConfig(root / "nope.yaml"), YAML::BadFile);
}
