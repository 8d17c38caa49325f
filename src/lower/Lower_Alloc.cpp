//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lower_Alloc.cpp
/// @brief Object and array construction, field access and record update.
///
/// Object memory: [vtable word][field region]; the visible pointer addresses
/// the field region. Array memory: [count:i32][reserved:i32][vtable word]
/// [elements]; the visible pointer addresses the first element.
///
/// Every construction path leaves no undefined bit between the start of the
/// allocation and the end of its last 64-bit word: objects zero each gap word
/// before storing fields, arrays are either allocated zeroed or have their
/// padding tail zeroed explicitly.
///
//===----------------------------------------------------------------------===//

#include "lower/FunctionLowerer.hpp"

#include "lower/GapFinder.hpp"
#include "lower/RuntimeNames.hpp"
#include "support/alignment.hpp"
#include "support/internal_error.hpp"

#include <algorithm>
#include <numeric>

namespace kiln::lower
{

using namespace kiln::core;
using support::fatal;
using support::SourceLoc;

namespace
{

Type i32Ty()
{
    return Type(Type::Kind::I32);
}

Type i64Ty()
{
    return Type(Type::Kind::I64);
}

Type ptrTy()
{
    return Type(Type::Kind::Ptr);
}

Type storeTypeForBytes(int64_t bytes)
{
    switch (bytes)
    {
        case 4:
            return i32Ty();
        case 2:
            return Type(Type::Kind::I16);
        default:
            return Type(Type::Kind::I8);
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// Objects
//===----------------------------------------------------------------------===//

uint32_t FunctionLowerer::objectFieldBytes(const std::vector<LayoutSlot> &slots) const
{
    uint32_t end = 0;
    for (const auto &slot : slots)
        end = std::max(end, slot.bitOffset + slotBits(slot, ptrBytes_));
    return support::alignUp<uint32_t>(end, 64) / 8;
}

void FunctionLowerer::lowerObjNew(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "object construction");
    if (cls.isArray())
        fatal(in.loc, "obj.new of array class '" + cls.name + "'");
    if (cls.isAbstract)
        fatal(in.loc, "obj.new of abstract class '" + cls.name + "'");
    const std::vector<LayoutSlot> slots = checkedLayout(cls, in.loc);
    if (in.operands.size() != cls.fields.size())
        fatal(in.loc,
              "obj.new of '" + cls.name + "' passes " + std::to_string(in.operands.size()) +
                  " values for " + std::to_string(cls.fields.size()) + " fields");

    const uint32_t fieldBytes = objectFieldBytes(slots);
    Value base = emitAlloc(Value::constInt(ptrBytes_ + fieldBytes), false);
    b_.store(ptrTy(), base, Value::constInt(0), vtableAddress(cls));
    emitGepInto(*in.result, base, Value::constInt(ptrBytes_));
    const Value obj = Value::temp(*in.result);

    for (uint32_t word : gapWords(slots, fieldBytes * 8, ptrBytes_))
        b_.store(i64Ty(), obj, Value::constInt(word), Value::constInt(0));

    for (const auto &slot : slots)
    {
        const size_t idx = *ctx_.layout().fieldIndex(cls, slot.name);
        storeAtBit(slot.type,
                   obj,
                   Value::constInt(slot.bitOffset / 8),
                   slot.bitOffset,
                   in.operands[idx],
                   in.loc);
    }
}

void FunctionLowerer::lowerObjGet(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "field read");
    if (in.fields.size() != 1 || in.operands.size() != 1)
        fatal(in.loc, "malformed obj.get");
    const std::vector<LayoutSlot> slots = checkedLayout(cls, in.loc);
    const LayoutSlot &slot = slotFor(cls, slots, in.fields.front(), in.loc);
    if (slot.type != in.type)
        fatal(in.loc,
              "obj.get of '" + cls.name + "." + slot.name + "' as " + in.type.toString() +
                  " but the field is " + slot.type.toString());
    emitLoadInto(*in.result,
                 slot.type,
                 in.operands[0],
                 Value::constInt(slot.bitOffset / 8),
                 bitAttrs(slot.type, slot.bitOffset, in.loc));
}

void FunctionLowerer::lowerObjSet(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "field write");
    if (in.fields.size() != 1 || in.operands.size() != 2)
        fatal(in.loc, "malformed obj.set");
    const std::vector<LayoutSlot> slots = checkedLayout(cls, in.loc);
    const LayoutSlot &slot = slotFor(cls, slots, in.fields.front(), in.loc);
    storeAtBit(slot.type,
               in.operands[0],
               Value::constInt(slot.bitOffset / 8),
               slot.bitOffset,
               in.operands[1],
               in.loc);
}

Value FunctionLowerer::objectSizeFor(const ClassDecl &cls, Value obj, SourceLoc loc)
{
    std::vector<ClassId> concrete = ctx_.dispatch().concreteSubclasses(cls.id);
    if (concrete.empty())
        concrete.push_back(cls.id);

    std::vector<VTableEntry> entries;
    bool uniform = true;
    for (ClassId id : concrete)
    {
        const ClassDecl &sub = referenceClass(id, loc, "record update");
        const int64_t size = ptrBytes_ + objectFieldBytes(checkedLayout(sub, loc));
        if (!entries.empty() && entries.front().value.i64 != size)
            uniform = false;
        entries.push_back({id, Value::constInt(size)});
    }
    if (uniform)
        return entries.front().value;

    const unsigned req =
        ctx_.registry().submit(std::move(entries), i64Ty(), cls.name + ".size", loc);
    MemAttrs cacheable;
    cacheable.cacheable = true;
    return b_.load(i64Ty(), loadVTable(std::move(obj)), Value::vtableSlot(req), cacheable);
}

void FunctionLowerer::lowerObjWith(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "record update");
    if (in.operands.empty() || in.fields.size() + 1 != in.operands.size())
        fatal(in.loc, "malformed obj.with");
    const std::vector<LayoutSlot> slots = checkedLayout(cls, in.loc);
    const Value src = in.operands[0];

    Value bytes = objectSizeFor(cls, src, in.loc);
    Value base = emitAlloc(bytes, false);
    Value srcBase = b_.gep(src, Value::constInt(-static_cast<int64_t>(ptrBytes_)));
    b_.memcpy(base, srcBase, bytes);
    emitGepInto(*in.result, base, Value::constInt(ptrBytes_));
    const Value obj = Value::temp(*in.result);

    for (size_t i = 0; i < in.fields.size(); ++i)
    {
        const LayoutSlot &slot = slotFor(cls, slots, in.fields[i], in.loc);
        storeAtBit(slot.type,
                   obj,
                   Value::constInt(slot.bitOffset / 8),
                   slot.bitOffset,
                   in.operands[i + 1],
                   in.loc);
    }
}

//===----------------------------------------------------------------------===//
// Arrays
//===----------------------------------------------------------------------===//

const ArraySlotInfo &FunctionLowerer::arrayInfo(const ClassDecl &cls, SourceLoc loc)
{
    if (!cls.isArray())
        fatal(loc, "array operation on non-array class '" + cls.name + "'");
    if (auto it = arrayInfoCache_.find(cls.id); it != arrayInfoCache_.end())
        return it->second;

    checkFieldTypes(cls, loc);
    ArraySlotInfo info = ctx_.layout().arraySlotInfo(cls);
    if (info.tupleTypes.size() != cls.fields.size() ||
        info.tupleBitOffsets.size() != cls.fields.size())
        fatal(loc,
              "element layout of '" + cls.name + "' has " + std::to_string(info.tupleTypes.size()) +
                  " slots but the class declares " + std::to_string(cls.fields.size()));
    if (info.elementBits == 0 || info.elementBits % 8 != 0)
        fatal(loc,
              "element size of '" + cls.name + "' is " + std::to_string(info.elementBits) +
                  " bits, not a whole number of bytes");
    for (size_t t = 0; t < info.tupleTypes.size(); ++t)
    {
        const uint32_t end = info.tupleBitOffsets[t] + bitWidth(info.tupleTypes[t], ptrBytes_);
        if (end > info.elementBits)
            fatal(loc, "element slot '" + cls.fields[t].name + "' of '" + cls.name + "' overflows");
    }
    return arrayInfoCache_.emplace(cls.id, std::move(info)).first->second;
}

void FunctionLowerer::emitTailZero(Value ptr, Value contentBytes, Value paddedBytes)
{
    if (contentBytes.kind == Value::Kind::ConstInt)
    {
        int64_t off = contentBytes.i64;
        const int64_t end = paddedBytes.i64;
        while (off < end)
        {
            int64_t width = 4;
            while (width > 1 && (off % width != 0 || off + width > end))
                width /= 2;
            b_.store(storeTypeForBytes(width), ptr, Value::constInt(off), Value::constInt(0));
            off += width;
        }
        return;
    }
    // The word ending at the padded size holds the tail. With no elements it is
    // a header word that is written afterwards.
    Value last = b_.add(i64Ty(), paddedBytes, Value::constInt(-8));
    b_.store(i64Ty(), ptr, last, Value::constInt(0));
}

FunctionLowerer::ArrayAllocation FunctionLowerer::emitArrayAlloc(const ClassDecl &cls,
                                                                 const ArraySlotInfo &info,
                                                                 Value count,
                                                                 bool zeroFill,
                                                                 unsigned result,
                                                                 SourceLoc loc)
{
    const int64_t elemBytes = info.elementBits / 8;
    const int64_t header = kArrayCountBytes + ptrBytes_;

    Value content;
    Value padded;
    Value bytes;
    Value count32;
    if (count.kind == Value::Kind::ConstInt)
    {
        if (count.i64 < 0)
            fatal(loc, "negative length for array of '" + cls.name + "'");
        const int64_t c = count.i64 * elemBytes;
        content = Value::constInt(c);
        padded = Value::constInt(support::alignUp<int64_t>(c, 8));
        bytes = Value::constInt(header + padded.i64);
        count32 = Value::constInt(count.i64);
    }
    else
    {
        content = elemBytes == 1 ? count : b_.mul(i64Ty(), count, Value::constInt(elemBytes));
        padded = content;
        if (elemBytes % 8 != 0)
            padded = b_.andBits(
                i64Ty(), b_.add(i64Ty(), content, Value::constInt(7)), Value::constInt(-8));
        bytes = b_.add(i64Ty(), padded, Value::constInt(header));
        count32 = b_.trunc(i32Ty(), count);
    }

    Value base = emitAlloc(bytes, zeroFill);
    emitGepInto(result, base, Value::constInt(header));
    const Value arr = Value::temp(result);

    if (!zeroFill)
    {
        if (elemBytes % 8 != 0)
            emitTailZero(arr, content, padded);
        b_.store(i32Ty(),
                 arr,
                 Value::constInt(-(kArrayCountBytes / 2) - static_cast<int64_t>(ptrBytes_)),
                 Value::constInt(0));
    }
    b_.store(i32Ty(), arr, Value::constInt(-header), count32);
    b_.store(ptrTy(), arr, Value::constInt(-static_cast<int64_t>(ptrBytes_)), vtableAddress(cls));
    return {arr, content};
}

size_t FunctionLowerer::tupleSlot(const ClassDecl &cls, const Instr &in) const
{
    if (in.fields.empty())
    {
        if (cls.fields.size() != 1)
            fatal(in.loc, "element access on '" + cls.name + "' must name a tuple slot");
        return 0;
    }
    auto idx = ctx_.layout().fieldIndex(cls, in.fields.front());
    if (!idx || *idx >= cls.fields.size())
        fatal(in.loc, "array class '" + cls.name + "' has no slot '" + in.fields.front() + "'");
    return *idx;
}

Value FunctionLowerer::elementOffset(Value index, uint32_t elemBytes, uint32_t tupleByte)
{
    if (index.kind == Value::Kind::ConstInt)
        return Value::constInt(index.i64 * elemBytes + tupleByte);
    Value scaled = elemBytes == 1 ? index : b_.mul(i64Ty(), index, Value::constInt(elemBytes));
    return addOffset(scaled, tupleByte);
}

void FunctionLowerer::lowerArrNew(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "array construction");
    const ArraySlotInfo &info = arrayInfo(cls, in.loc);
    const size_t arity = info.tupleTypes.size();
    if (arity == 0 ? !in.operands.empty() : in.operands.size() % arity != 0)
        fatal(in.loc,
              "arr.new of '" + cls.name + "' passes " + std::to_string(in.operands.size()) +
                  " values for tuples of " + std::to_string(arity));
    const size_t count = arity == 0 ? 0 : in.operands.size() / arity;

    const Value countValue = Value::constInt(static_cast<long long>(count));
    const Value arr = emitArrayAlloc(cls, info, countValue, true, *in.result, in.loc).ptr;
    knownLengths_[*in.result] = static_cast<int64_t>(count);

    std::vector<size_t> order(arity);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(),
                     order.end(),
                     [&](size_t a, size_t b)
                     { return info.tupleBitOffsets[a] < info.tupleBitOffsets[b]; });

    const uint32_t elemBytes = info.elementBits / 8;
    for (size_t e = 0; e < count; ++e)
    {
        for (size_t t : order)
        {
            const Value &v = in.operands[e * arity + t];
            // The allocation is zero-filled already.
            if (v.isZeroBits())
                continue;
            const uint32_t bit = info.tupleBitOffsets[t];
            storeAtBit(info.tupleTypes[t],
                       arr,
                       Value::constInt(static_cast<long long>(e * elemBytes + bit / 8)),
                       bit,
                       v,
                       in.loc);
        }
    }
}

void FunctionLowerer::lowerArrAlloc(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "array construction");
    const ArraySlotInfo &info = arrayInfo(cls, in.loc);
    if (in.operands.size() != 1)
        fatal(in.loc, "malformed arr.alloc");
    emitArrayAlloc(cls, info, in.operands[0], true, *in.result, in.loc);
    if (in.operands[0].kind == Value::Kind::ConstInt)
        knownLengths_[*in.result] = in.operands[0].i64;
}

void FunctionLowerer::lowerArrClone(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "array clone");
    const ArraySlotInfo &info = arrayInfo(cls, in.loc);
    if (in.operands.size() != 1)
        fatal(in.loc, "malformed arr.clone");
    const Value src = in.operands[0];

    // A source built here with a constant length gives the clone a constant size.
    Value count = Value::null();
    auto known = src.kind == Value::Kind::Temp ? knownLengths_.find(src.id) : knownLengths_.end();
    if (known != knownLengths_.end())
    {
        const int64_t length = known->second;
        count = Value::constInt(length);
        knownLengths_[*in.result] = length;
    }
    else
    {
        MemAttrs cacheable;
        cacheable.cacheable = true;
        const int64_t countOffset = -(kArrayCountBytes + static_cast<int64_t>(ptrBytes_));
        Value count32 = b_.load(i32Ty(), src, Value::constInt(countOffset), cacheable);
        count = b_.zext(i64Ty(), count32);
    }

    ArrayAllocation alloc = emitArrayAlloc(cls, info, count, false, *in.result, in.loc);
    b_.memcpy(alloc.ptr, src, alloc.contentBytes);
}

void FunctionLowerer::lowerArrGet(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "array read");
    const ArraySlotInfo &info = arrayInfo(cls, in.loc);
    if (in.operands.size() != 2)
        fatal(in.loc, "malformed arr.get");
    const size_t t = tupleSlot(cls, in);
    const Type slotType = info.tupleTypes[t];
    if (slotType != in.type)
        fatal(in.loc,
              "arr.get of '" + cls.name + "' as " + in.type.toString() + " but the slot is " +
                  slotType.toString());
    const uint32_t bit = info.tupleBitOffsets[t];
    Value offset = elementOffset(in.operands[1], info.elementBits / 8, bit / 8);
    emitLoadInto(*in.result, slotType, in.operands[0], offset, bitAttrs(slotType, bit, in.loc));
}

void FunctionLowerer::lowerArrSet(const Instr &in)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "array write");
    const ArraySlotInfo &info = arrayInfo(cls, in.loc);
    if (in.operands.size() != 3)
        fatal(in.loc, "malformed arr.set");
    const size_t t = tupleSlot(cls, in);
    const uint32_t bit = info.tupleBitOffsets[t];
    Value offset = elementOffset(in.operands[1], info.elementBits / 8, bit / 8);
    storeAtBit(info.tupleTypes[t], in.operands[0], offset, bit, in.operands[2], in.loc);
}

void FunctionLowerer::lowerArrHeaderLoad(const Instr &in, int64_t offset)
{
    const ClassDecl &cls = referenceClass(in.classId, in.loc, "array header read");
    if (!cls.isArray())
        fatal(in.loc, "array header read on non-array class '" + cls.name + "'");
    if (in.operands.size() != 1)
        fatal(in.loc, "malformed array header read");

    MemAttrs cacheable;
    cacheable.cacheable = true;
    if (in.type == i32Ty())
    {
        emitLoadInto(*in.result, i32Ty(), in.operands[0], Value::constInt(offset), cacheable);
        return;
    }
    Value word = b_.load(i32Ty(), in.operands[0], Value::constInt(offset), cacheable);
    Instr widen;
    widen.result = in.result;
    widen.op = Opcode::Zext;
    widen.type = in.type;
    widen.operands = {word};
    b_.append(std::move(widen));
}

} // namespace kiln::lower
