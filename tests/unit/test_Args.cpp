#include <gtest/gtest.h>

#include "shell/Usage.hpp"
#include "shell/helpers.hpp"

using namespace rcs::shell;

TEST(ArgsTest, ShortAndLongFormsAreEquivalent) {
    const auto a = parseArgs({"-d", "/tmp/backup"});
    const auto b = parseArgs({"--dir", "/tmp/backup"});
    const auto c = parseArgs({"--dir=/tmp/backup"});

    for (const auto& call : {a, b, c}) {
        EXPECT_EQ(optVal(call, "dir"), "/tmp/backup");
        EXPECT_TRUE(call.positionals.empty());
    }
}

TEST(ArgsTest, GluedShortValue) {
    const auto call = parseArgs({"-d/tmp/backup"});
    EXPECT_EQ(optVal(call, "dir"), "/tmp/backup");
}

TEST(ArgsTest, SwitchesDoNotSwallowValues) {
    const auto call = parseArgs({"-l", "extra"});
    EXPECT_TRUE(hasFlag(call, "list-exports"));
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "extra");
}

TEST(ArgsTest, MissingValueIsRecordedWithoutOne) {
    const auto call = parseArgs({"--dir"});
    EXPECT_TRUE(hasFlag(call, "dir"));
    EXPECT_FALSE(optVal(call, "dir").has_value());
}

TEST(ArgsTest, UnknownFlagKeepsItsSpelling) {
    const auto call = parseArgs({"--bogus", "-x"});
    ASSERT_EQ(call.options.size(), 2u);
    EXPECT_EQ(call.options[0].key, "bogus");
    EXPECT_EQ(call.options[1].key, "x");
    EXPECT_TRUE(canonicalFlag("bogus").empty());
}

TEST(ArgsTest, LastValueWins) {
    const auto call = parseArgs({"-d", "/a", "--dir", "/b"});
    EXPECT_EQ(optVal(call, "dir"), "/b");
}

TEST(ArgsTest, RestoreWithDir) {
    const auto call = parseArgs({"-d", "/backup", "-r", "20240101_bank_1"});
    EXPECT_EQ(optVal(call, "dir"), "/backup");
    EXPECT_EQ(optVal(call, "restore"), "20240101_bank_1");
}

TEST(ArgsTest, UsageMentionsEveryFlag) {
    const auto text = usageText();
    for (const auto& f : flags())
        EXPECT_NE(text.find("--" + f.name), std::string::npos) << f.name;
}
