//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Driver loop of FunctionLowerer plus the memory helpers shared by the
// allocation, dispatch and freeze lowerings.
//
//===----------------------------------------------------------------------===//

#include "lower/FunctionLowerer.hpp"

#include "ir/core/OpcodeInfo.hpp"
#include "ir/utils/Utils.hpp"
#include "lower/RuntimeNames.hpp"
#include "support/internal_error.hpp"

#include <utility>

namespace kiln::lower
{

using namespace kiln::core;
using support::fatal;
using support::SourceLoc;

Value zeroValue(Type type, SourceLoc loc)
{
    switch (type.kind)
    {
        case Type::Kind::I1:
            return Value::constBool(false);
        case Type::Kind::I8:
        case Type::Kind::I16:
        case Type::Kind::I32:
        case Type::Kind::I64:
            return Value::constInt(0);
        case Type::Kind::F32:
        case Type::Kind::F64:
            return Value::constFloat(0.0);
        case Type::Kind::Ptr:
        case Type::Kind::Label:
            return Value::null();
        case Type::Kind::Void:
        case Type::Kind::Str:
        case Type::Kind::Agg:
            break;
    }
    fatal(loc, "type " + type.toString() + " has no zero value");
}

FunctionLowerer::FunctionLowerer(LoweringContext &ctx, Function &fn)
    : ctx_(ctx), fn_(fn), b_(ctx.module()), ptrBytes_(ctx.target().pointerBytes)
{
}

void FunctionLowerer::run()
{
    if (!fn_.hasBody())
        return;

    const unsigned next = util::nextTempId(fn_);
    std::vector<BasicBlock> original = std::move(fn_.blocks);
    fn_.blocks.clear();
    fn_.blocks.reserve(original.size());
    for (const auto &bb : original)
    {
        std::vector<Type> types;
        types.reserve(bb.params.size());
        for (const auto &p : bb.params)
            types.push_back(p.type);
        blockParamTypes_[bb.label] = std::move(types);
        fn_.blocks.push_back(BasicBlock{bb.label, bb.params, {}, false});
    }

    b_.resumeFunction(fn_, next);
    for (size_t i = 0; i < original.size(); ++i)
    {
        b_.setInsertPoint(fn_.blocks[i]);
        for (auto &in : original[i].instructions)
            lowerInstr(std::move(in));
    }

    util::replaceTemps(fn_, replacements_);

    if (std::ostream *os = ctx_.trace())
        *os << "[lower] @" << fn_.name << ": " << original.size() << " blocks -> "
            << fn_.blocks.size() << " blocks\n";
}

void FunctionLowerer::resolveOperands(Instr &in) const
{
    if (replacements_.empty())
        return;
    util::forEachValue(in,
                       [this](Value &v)
                       {
                           while (v.kind == Value::Kind::Temp)
                           {
                               auto it = replacements_.find(v.id);
                               if (it == replacements_.end())
                                   break;
                               v = it->second;
                           }
                       });
}

bool FunctionLowerer::readsUnreachable(Instr &in) const
{
    if (unreachable_.empty())
        return false;
    bool found = false;
    util::forEachValue(in,
                       [&](Value &v)
                       {
                           if (v.kind == Value::Kind::Temp && unreachable_.count(v.id))
                               found = true;
                       });
    return found;
}

void FunctionLowerer::dropUnreachableUse(const Instr &in)
{
    b_.unreachable();
    if (in.result)
        unreachable_.insert(*in.result);
    if (!isTerminator(in.op))
        continueIn(b_.createUniqueBlock(currentLabel() + ".dead").label, in.loc);
}

void FunctionLowerer::lowerInstr(Instr in)
{
    resolveOperands(in);
    b_.setLoc(in.loc);
    // Aggregates produced by a call that never returns have no value; only
    // extract degrades them.
    if (in.op != Opcode::Extract && readsUnreachable(in))
    {
        dropUnreachableUse(in);
        return;
    }
    switch (in.op)
    {
        case Opcode::Add:
        case Opcode::Sub:
        case Opcode::Mul:
        case Opcode::And:
        case Opcode::Or:
        case Opcode::ICmpEq:
        case Opcode::ICmpNe:
        case Opcode::Zext:
        case Opcode::Trunc:
        case Opcode::GEP:
        case Opcode::Load:
        case Opcode::Store:
        case Opcode::MemCopy:
        case Opcode::Call:
        case Opcode::CallIndirect:
        case Opcode::InvokeIndirect:
        case Opcode::Br:
        case Opcode::CBr:
        case Opcode::SwitchI32:
        case Opcode::IndirectBr:
        case Opcode::Ret:
        case Opcode::Unreachable:
            b_.append(std::move(in));
            return;
        case Opcode::Extract:
            lowerExtract(std::move(in));
            return;
        case Opcode::ObjNew:
            lowerObjNew(in);
            return;
        case Opcode::ObjGet:
            lowerObjGet(in);
            return;
        case Opcode::ObjSet:
            lowerObjSet(in);
            return;
        case Opcode::ObjWith:
            lowerObjWith(in);
            return;
        case Opcode::ArrNew:
            lowerArrNew(in);
            return;
        case Opcode::ArrAlloc:
            lowerArrAlloc(in);
            return;
        case Opcode::ArrClone:
            lowerArrClone(in);
            return;
        case Opcode::ArrGet:
            lowerArrGet(in);
            return;
        case Opcode::ArrSet:
            lowerArrSet(in);
            return;
        case Opcode::ArrSize:
            lowerArrHeaderLoad(in, -(kArrayCountBytes + static_cast<int64_t>(ptrBytes_)));
            return;
        case Opcode::ArrHash:
            lowerArrHeaderLoad(in, -(kArrayCountBytes / 2 + static_cast<int64_t>(ptrBytes_)));
            return;
        case Opcode::VCall:
        case Opcode::VInvoke:
            lowerVirtualCall(in);
            return;
        case Opcode::TypeSwitch:
            lowerTypeSwitch(in);
            return;
        case Opcode::Freeze:
            lowerFreeze(in);
            return;
        case Opcode::Count:
            break;
    }
    fatal(in.loc, "invalid opcode");
}

//===----------------------------------------------------------------------===//
// Shared helpers
//===----------------------------------------------------------------------===//

const ClassDecl &FunctionLowerer::referenceClass(ClassId id, SourceLoc loc, const char *what) const
{
    const ClassDecl &cls = ctx_.classDecl(id, loc);
    if (!cls.isReference())
        fatal(loc, std::string(what) + " of value class '" + cls.name + "'");
    return cls;
}

void FunctionLowerer::checkFieldTypes(const ClassDecl &cls, SourceLoc loc) const
{
    for (const auto &field : cls.fields)
        if (!hasScalarRepresentation(field.type))
            fatal(loc,
                  "field '" + field.name + "' of class '" + cls.name + "' has unstorable type " +
                      field.type.toString());
}

std::vector<LayoutSlot> FunctionLowerer::checkedLayout(const ClassDecl &cls, SourceLoc loc) const
{
    checkFieldTypes(cls, loc);
    std::vector<LayoutSlot> slots = ctx_.layout().layout(cls);
    if (slots.size() != cls.fields.size())
        fatal(loc,
              "layout of class '" + cls.name + "' has " + std::to_string(slots.size()) +
                  " slots but the class declares " + std::to_string(cls.fields.size()) +
                  " fields");
    for (size_t i = 1; i < slots.size(); ++i)
    {
        const LayoutSlot &prev = slots[i - 1];
        if (prev.bitOffset + slotBits(prev, ptrBytes_) > slots[i].bitOffset)
            fatal(loc,
                  "layout of class '" + cls.name + "' overlaps fields '" + prev.name + "' and '" +
                      slots[i].name + "'");
    }
    return slots;
}

const LayoutSlot &FunctionLowerer::slotFor(const ClassDecl &cls,
                                           const std::vector<LayoutSlot> &slots,
                                           const std::string &field,
                                           SourceLoc loc) const
{
    auto index = ctx_.layout().fieldIndex(cls, field);
    if (!index || *index >= cls.fields.size())
        fatal(loc, "class '" + cls.name + "' has no field '" + field + "'");
    const std::string &name = cls.fields[*index].name;
    for (const auto &slot : slots)
        if (slot.name == name)
            return slot;
    fatal(loc, "layout of class '" + cls.name + "' does not place field '" + name + "'");
}

Value FunctionLowerer::emitAlloc(Value bytes, bool zero)
{
    return *b_.call(kRtAlloc, Type(Type::Kind::Ptr), {std::move(bytes), Value::constBool(zero)});
}

Value FunctionLowerer::vtableAddress(const ClassDecl &cls)
{
    ctx_.registry().requireVTable(cls.id);
    return Value::global(vtableSymbol(cls.name));
}

void FunctionLowerer::emitGepInto(unsigned result, Value base, Value offset)
{
    Instr gep;
    gep.result = result;
    gep.op = Opcode::GEP;
    gep.type = Type(Type::Kind::Ptr);
    gep.operands = {std::move(base), std::move(offset)};
    b_.append(std::move(gep));
}

void FunctionLowerer::emitLoadInto(
    unsigned result, Type type, Value ptr, Value offset, MemAttrs attrs)
{
    Instr load;
    load.result = result;
    load.op = Opcode::Load;
    load.type = type;
    load.operands = {std::move(ptr), std::move(offset)};
    load.MemAttr = attrs;
    b_.append(std::move(load));
}

MemAttrs FunctionLowerer::bitAttrs(Type type, uint32_t bitOffset, SourceLoc loc) const
{
    MemAttrs attrs;
    if (bitOffset % 8 == 0)
        return attrs;
    if (type.kind != Type::Kind::I1)
        fatal(loc,
              type.toString() + " slot at bit offset " + std::to_string(bitOffset) +
                  " is not byte aligned");
    attrs.bit = static_cast<uint8_t>(bitOffset % 8);
    return attrs;
}

void FunctionLowerer::storeAtBit(
    Type type, Value ptr, Value byteOffset, uint32_t bitOffset, Value value, SourceLoc loc)
{
    b_.store(type,
             std::move(ptr),
             std::move(byteOffset),
             std::move(value),
             bitAttrs(type, bitOffset, loc));
}

Value FunctionLowerer::addOffset(Value base, int64_t constant)
{
    if (base.kind == Value::Kind::ConstInt)
        return Value::constInt(base.i64 + constant);
    if (constant == 0)
        return base;
    return b_.add(Type(Type::Kind::I64), std::move(base), Value::constInt(constant));
}

std::string FunctionLowerer::currentLabel()
{
    return b_.insertBlock().label;
}

void FunctionLowerer::continueIn(const std::string &label, SourceLoc loc)
{
    BasicBlock *bb = util::findBlock(fn_, label);
    if (!bb)
        fatal(loc, "lost block '" + label + "' in @" + fn_.name);
    b_.setInsertPoint(*bb);
}

} // namespace kiln::lower
