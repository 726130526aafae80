#include <gtest/gtest.h>

#include "bank/Slot.hpp"
#include "bank/SlotIndex.hpp"
#include "sync/Error.hpp"

using namespace rcs::bank;
using namespace rcs::sync;

TEST(SlotTest, BankOfIsCeilingOfSlotOverEight) {
    for (unsigned int n = 1; n <= 64; ++n)
        EXPECT_EQ(bankOf(std::to_string(n) + "_1"), (n + 7) / 8) << "slot " << n;
}

TEST(SlotTest, BankBoundaries) {
    EXPECT_EQ(bankOf("001_1"), 1u);
    EXPECT_EQ(bankOf("008_2"), 1u);
    EXPECT_EQ(bankOf("009_1"), 2u);
    EXPECT_EQ(bankOf("064_1"), 8u);
}

TEST(SlotTest, LeadingZerosAreIgnored) {
    EXPECT_EQ(bankOf("009_1"), bankOf("9_1"));
    EXPECT_EQ(bankOf("0017_2"), 3u);
}

TEST(SlotTest, ParseKeepsOriginalName) {
    const auto slot = Slot::parse("012_2");
    EXPECT_EQ(slot.number, 12u);
    EXPECT_EQ(slot.alternate, 2u);
    EXPECT_EQ(slot.name, "012_2");
}

TEST(SlotTest, MalformedNamesAreRejected) {
    for (const auto* name : {"", "abc", "001", "001_3", "_1", "001_1.WAV", "0_1", "000_1", "-1_1", "1_1_1"}) {
        EXPECT_FALSE(Slot::tryParse(name).has_value()) << name;
        try {
            (void)bankOf(name);
            FAIL() << "expected MalformedSlotName for '" << name << "'";
        } catch (const Error& e) {
            EXPECT_EQ(e.kind(), ErrorKind::MalformedSlotName);
        }
    }
}

TEST(SlotTest, BankDirName) {
    EXPECT_EQ(bankDirName(3), "bank_3");
}

TEST(SlotIndexTest, SkipsNonSlotsAndBanksOutOfRange) {
    const auto index = SlotIndex::fromNames({"001_1", ".DS_Store", "notes", "065_1", "010_2", "009_1"});

    EXPECT_EQ(index.size(), 3u);
    EXPECT_FALSE(index.contains("065_1"));
    EXPECT_EQ(index.bankOf("010_2"), 2u);
    EXPECT_FALSE(index.bankOf("notes").has_value());

    const auto& bank2 = index.slotsIn(2);
    ASSERT_EQ(bank2.size(), 2u);
    EXPECT_EQ(bank2[0], "009_1");
    EXPECT_EQ(bank2[1], "010_2");

    EXPECT_TRUE(index.slotsIn(5).empty());
    EXPECT_TRUE(index.slotsIn(0).empty());
    EXPECT_TRUE(index.slotsIn(9).empty());
}

TEST(SlotIndexTest, EmptyIndex) {
    EXPECT_TRUE(SlotIndex::fromNames({"README", "foo_bar"}).empty());
}
