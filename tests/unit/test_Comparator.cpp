#include "support/TempTree.hpp"

#include "sync/Comparator.hpp"

#include <stdexcept>

using namespace rcs::sync;
using rcs::test::TempTree;

class ComparatorTest : public TempTree {};

TEST_F(ComparatorTest, ZeroPrefixIsRejected) {
    EXPECT_THROW(Comparator(0), std::invalid_argument);
}

TEST_F(ComparatorTest, IdenticalFilesDoNotDiffer) {
    writeFile(root / "a.WAV", "RIFF....WAVEfmt data");
    writeFile(root / "b.WAV", "RIFF....WAVEfmt data");
    EXPECT_FALSE(Comparator().differs(root / "a.WAV", root / "b.WAV"));
}

TEST_F(ComparatorTest, MissingSideDiffers) {
    writeFile(root / "a.WAV", "x");
    const Comparator cmp;
    EXPECT_TRUE(cmp.differs(root / "a.WAV", root / "missing.WAV"));
    EXPECT_TRUE(cmp.differs(root / "missing.WAV", root / "a.WAV"));
}

TEST_F(ComparatorTest, SizeChangeDiffers) {
    writeFile(root / "a.WAV", "abcd");
    writeFile(root / "b.WAV", "abcde");
    EXPECT_TRUE(Comparator().differs(root / "a.WAV", root / "b.WAV"));
}

TEST_F(ComparatorTest, SameSizeEditInsidePrefixDiffers) {
    std::string a(100000, 'a');
    std::string b = a;
    b[100] = 'b';
    writeFile(root / "a.WAV", a);
    writeFile(root / "b.WAV", b);
    EXPECT_TRUE(Comparator(65536).differs(root / "a.WAV", root / "b.WAV"));
}

TEST_F(ComparatorTest, SameSizeEditPastPrefixGoesUnnoticed) {
    std::string a(100000, 'a');
    std::string b = a;
    b[65536] = 'b';
    writeFile(root / "a.WAV", a);
    writeFile(root / "b.WAV", b);

    EXPECT_FALSE(Comparator(65536).differs(root / "a.WAV", root / "b.WAV"));
    EXPECT_TRUE(Comparator(65537).differs(root / "a.WAV", root / "b.WAV"));
}
