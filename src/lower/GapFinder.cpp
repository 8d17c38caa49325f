// File: src/lower/GapFinder.cpp
// Purpose: Implements uncovered-bit search over sorted layouts.
// Key invariants: Loop form; the scan never revisits a slot.
// Ownership/Lifetime: Stateless.
// Links: lower/GapFinder.hpp

#include "lower/GapFinder.hpp"

namespace kiln::lower
{

uint32_t nextGap(const std::vector<LayoutSlot> &slots, uint32_t fromBit, unsigned pointerBytes)
{
    uint32_t pos = fromBit;
    for (const auto &slot : slots)
    {
        const uint32_t end = slot.bitOffset + slotBits(slot, pointerBytes);
        if (end <= pos)
            continue;
        if (slot.bitOffset > pos)
            return pos;
        pos = end;
    }
    return pos;
}

std::vector<uint32_t> gapWords(const std::vector<LayoutSlot> &slots,
                               uint32_t regionBits,
                               unsigned pointerBytes)
{
    std::vector<uint32_t> words;
    uint32_t bit = nextGap(slots, 0, pointerBytes);
    while (bit < regionBits)
    {
        const uint32_t word = bit / 64;
        words.push_back(word * 8);
        bit = nextGap(slots, (word + 1) * 64, pointerBytes);
    }
    return words;
}

} // namespace kiln::lower
