//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the natural layout oracle.
//
//===----------------------------------------------------------------------===//

#include "lower/Layout.hpp"

#include "support/alignment.hpp"
#include "support/internal_error.hpp"

#include <algorithm>

namespace kiln::lower
{

using namespace kiln::core;

uint32_t slotBits(const LayoutSlot &slot, unsigned pointerBytes)
{
    return bitWidth(slot.type, pointerBytes);
}

std::vector<LayoutSlot> NaturalLayoutOracle::naturalLayout(
    const std::vector<FieldDecl> &fields) const
{
    std::vector<LayoutSlot> slots;
    slots.reserve(fields.size());
    uint32_t bit = 0;
    for (const auto &field : fields)
    {
        const uint32_t width = bitWidth(field.type, pointerBytes_);
        if (width == 0)
            support::fatal({},
                           "field '" + field.name + "' has unstorable type " +
                               field.type.toString());
        if (width > 1)
            bit = support::alignUp<uint32_t>(bit, width);
        slots.push_back({field.name, bit, field.type});
        bit += width;
    }
    return slots;
}

std::vector<LayoutSlot> NaturalLayoutOracle::layout(const ClassDecl &cls) const
{
    std::vector<LayoutSlot> slots;
    if (auto it = explicitLayouts_.find(cls.id); it != explicitLayouts_.end())
        slots = it->second;
    else
        slots = naturalLayout(cls.fields);
    std::stable_sort(slots.begin(),
                     slots.end(),
                     [](const LayoutSlot &a, const LayoutSlot &b)
                     { return a.bitOffset < b.bitOffset; });
    return slots;
}

ArraySlotInfo NaturalLayoutOracle::arraySlotInfo(const ClassDecl &cls) const
{
    if (auto it = explicitArrays_.find(cls.id); it != explicitArrays_.end())
        return it->second;

    ArraySlotInfo info;
    uint32_t end = 0;
    uint32_t align = 8;
    for (const auto &slot : naturalLayout(cls.fields))
    {
        const uint32_t width = slotBits(slot, pointerBytes_);
        info.tupleBitOffsets.push_back(slot.bitOffset);
        info.tupleTypes.push_back(slot.type);
        end = std::max(end, slot.bitOffset + width);
        align = std::max(align, std::min<uint32_t>(width, 64));
    }
    info.elementBits = support::alignUp<uint32_t>(std::max<uint32_t>(end, 8), align);
    return info;
}

std::optional<size_t> NaturalLayoutOracle::fieldIndex(const ClassDecl &cls,
                                                      const std::string &name) const
{
    for (size_t i = 0; i < cls.fields.size(); ++i)
        if (cls.fields[i].name == name)
            return i;
    return std::nullopt;
}

void NaturalLayoutOracle::setLayout(ClassId cls, std::vector<LayoutSlot> slots)
{
    explicitLayouts_[cls] = std::move(slots);
}

void NaturalLayoutOracle::setArraySlotInfo(ClassId cls, ArraySlotInfo info)
{
    explicitArrays_[cls] = std::move(info);
}

} // namespace kiln::lower
