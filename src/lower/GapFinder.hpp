// File: src/lower/GapFinder.hpp
// Purpose: Locate bits of an object's field region that no layout slot covers.
// Key invariants: Input slots are sorted by bit offset and do not overlap.
// Ownership/Lifetime: Pure functions over caller-owned layouts.
// Links: lower/Layout.hpp, lower/Lower_Alloc.cpp
#pragma once

#include "lower/Layout.hpp"

#include <cstdint>
#include <vector>

namespace kiln::lower
{

/// @brief First bit at or after @p fromBit that is not covered by any slot.
/// @details Bits past the last slot are uncovered, so the result is at most
///          max(fromBit, end of last slot).
uint32_t nextGap(const std::vector<LayoutSlot> &slots, uint32_t fromBit, unsigned pointerBytes);

/// @brief Byte offsets of every 64-bit word in [0, regionBits) that contains
///        at least one uncovered bit, in increasing order.
std::vector<uint32_t> gapWords(const std::vector<LayoutSlot> &slots,
                               uint32_t regionBits,
                               unsigned pointerBytes);

} // namespace kiln::lower
