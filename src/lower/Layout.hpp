//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the layout oracle consumed by object lowering. A layout
// maps each field of a reference class to a bit offset measured from the
// object's visible pointer (the first byte after the vtable word). Array
// classes describe one element tuple; elements are stored back to back at a
// whole number of bytes each.
//
// Invariants of every layout returned by an oracle:
// - slots are sorted by strictly increasing bitOffset and never overlap;
// - non-i1 slots start on a byte boundary;
// - the slot count equals the class's declared field count.
// Lowering re-checks the last invariant and treats violations as internal
// errors.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Class.hpp"
#include "ir/core/Type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln::lower
{

/// @brief Placement of one field.
struct LayoutSlot
{
    std::string name;
    uint32_t bitOffset = 0;
    core::Type type;
};

/// @brief Element layout of an array class.
struct ArraySlotInfo
{
    /// Size of one element tuple in bits; a multiple of 8.
    uint32_t elementBits = 0;

    /// Bit offset of each tuple slot within the element, in declaration order.
    std::vector<uint32_t> tupleBitOffsets;

    /// Type of each tuple slot, in declaration order.
    std::vector<core::Type> tupleTypes;
};

/// @brief Read-only source of field placements.
class LayoutOracle
{
  public:
    virtual ~LayoutOracle() = default;

    /// @brief Field slots of object class @p cls ordered by bit offset.
    virtual std::vector<LayoutSlot> layout(const core::ClassDecl &cls) const = 0;

    /// @brief Element tuple description of array class @p cls.
    virtual ArraySlotInfo arraySlotInfo(const core::ClassDecl &cls) const = 0;

    /// @brief Declaration index of field @p name of @p cls.
    virtual std::optional<size_t> fieldIndex(const core::ClassDecl &cls,
                                             const std::string &name) const = 0;
};

/// @brief Layout oracle placing fields in declaration order at their natural
///        alignment. Booleans occupy one bit and pack with neighbouring
///        booleans. Explicit layouts may be installed per class to describe
///        sparse or hand-packed records.
class NaturalLayoutOracle final : public LayoutOracle
{
  public:
    explicit NaturalLayoutOracle(unsigned pointerBytes = 8) : pointerBytes_(pointerBytes) {}

    std::vector<LayoutSlot> layout(const core::ClassDecl &cls) const override;
    ArraySlotInfo arraySlotInfo(const core::ClassDecl &cls) const override;
    std::optional<size_t> fieldIndex(const core::ClassDecl &cls,
                                     const std::string &name) const override;

    /// @brief Replace the computed layout of class @p cls by @p slots.
    void setLayout(core::ClassId cls, std::vector<LayoutSlot> slots);

    /// @brief Replace the computed element layout of array class @p cls.
    void setArraySlotInfo(core::ClassId cls, ArraySlotInfo info);

  private:
    unsigned pointerBytes_;
    std::unordered_map<core::ClassId, std::vector<LayoutSlot>> explicitLayouts_;
    std::unordered_map<core::ClassId, ArraySlotInfo> explicitArrays_;

    std::vector<LayoutSlot> naturalLayout(const std::vector<core::FieldDecl> &fields) const;
};

/// @brief Width in bits of the value stored in @p slot.
uint32_t slotBits(const LayoutSlot &slot, unsigned pointerBytes);

} // namespace kiln::lower
