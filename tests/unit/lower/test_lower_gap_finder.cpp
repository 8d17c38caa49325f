// File: tests/unit/lower/test_lower_gap_finder.cpp
// Purpose: Verify gap detection over sorted layout slots.
// Key invariants: A word is reported when any of its bits is not covered by a slot.
// Ownership/Lifetime: Test owns all slot vectors.
// Links: docs/lowering.md

#include <gtest/gtest.h>

#include "lower/GapFinder.hpp"

using namespace kiln::lower;
using kiln::core::Type;

namespace
{

LayoutSlot slot(const char *name, uint32_t bit, Type::Kind kind)
{
    return {name, bit, Type(kind)};
}

} // namespace

TEST(GapFinderTest, DenseLayoutHasNoGap)
{
    std::vector<LayoutSlot> slots = {slot("a", 0, Type::Kind::I64), slot("b", 64, Type::Kind::I64)};
    EXPECT_EQ(nextGap(slots, 0, 8), 128u);
    EXPECT_TRUE(gapWords(slots, 128, 8).empty());
}

TEST(GapFinderTest, FindsHoleBetweenSlots)
{
    std::vector<LayoutSlot> slots = {slot("a", 0, Type::Kind::I32), slot("b", 64, Type::Kind::I64)};
    EXPECT_EQ(nextGap(slots, 0, 8), 32u);
    EXPECT_EQ(nextGap(slots, 64, 8), 128u);
    EXPECT_EQ(gapWords(slots, 128, 8), std::vector<uint32_t>({0}));
}

TEST(GapFinderTest, ReportsEachPartiallyCoveredWordOnce)
{
    // Word 0: a byte and a flag bit. Word 1: upper half only. Word 2: empty.
    // Word 3: fully covered.
    std::vector<LayoutSlot> slots = {slot("a", 0, Type::Kind::I8),
                                     slot("flag", 13, Type::Kind::I1),
                                     slot("b", 96, Type::Kind::I32),
                                     slot("c", 192, Type::Kind::I64)};
    EXPECT_EQ(gapWords(slots, 256, 8), std::vector<uint32_t>({0, 8, 16}));
}

TEST(GapFinderTest, TrailingPaddingIsAGap)
{
    std::vector<LayoutSlot> slots = {slot("a", 0, Type::Kind::I64), slot("b", 64, Type::Kind::I8)};
    EXPECT_EQ(gapWords(slots, 128, 8), std::vector<uint32_t>({8}));
}

TEST(GapFinderTest, EmptyLayoutZeroesEveryWord)
{
    EXPECT_EQ(gapWords({}, 192, 8), std::vector<uint32_t>({0, 8, 16}));
    EXPECT_TRUE(gapWords({}, 0, 8).empty());
}

TEST(GapFinderTest, PointerWidthFollowsTarget)
{
    std::vector<LayoutSlot> slots = {slot("p", 0, Type::Kind::Ptr), slot("q", 32, Type::Kind::Ptr)};
    EXPECT_TRUE(gapWords(slots, 64, 4).empty());
    EXPECT_EQ(nextGap(slots, 0, 8), 96u);
}
