// File: src/vm/Machine.cpp
// Purpose: Implements the lowered-IR interpreter and its simulated heap.
// Key invariants: Addresses below kHeapBase are never mapped, so null traps.
//                 Function and label addresses live in disjoint ranges above the heap.
// Ownership/Lifetime: Heap storage is owned by the machine.
// Links: docs/lowering.md

#include "vm/Machine.hpp"

#include "ir/core/Module.hpp"
#include "ir/utils/Utils.hpp"
#include "support/alignment.hpp"

#include <algorithm>
#include <cstring>

namespace kiln::vm
{

using namespace kiln::core;

namespace
{

constexpr uint64_t kHeapBase = 0x10000;
constexpr uint64_t kHeapLimit = 0x30000000;
constexpr uint64_t kFunctionBase = 0x40000000;
constexpr uint64_t kLabelBase = 0x60000000;
constexpr uint64_t kCodeStride = 16;

unsigned byteWidth(Type type, unsigned pointerBytes)
{
    switch (type.kind)
    {
        case Type::Kind::I1:
        case Type::Kind::I8:
            return 1;
        case Type::Kind::I16:
            return 2;
        case Type::Kind::I32:
        case Type::Kind::F32:
            return 4;
        case Type::Kind::I64:
        case Type::Kind::F64:
            return 8;
        case Type::Kind::Ptr:
        case Type::Kind::Label:
            return pointerBytes;
        case Type::Kind::Void:
        case Type::Kind::Str:
        case Type::Kind::Agg:
            break;
    }
    throw Trap("type " + type.toString() + " has no memory representation");
}

uint64_t maskBits(uint64_t v, unsigned bytes)
{
    return bytes >= 8 ? v : v & ((uint64_t{1} << (bytes * 8)) - 1);
}

} // namespace

Machine::Machine(const Module &module, unsigned pointerBytes)
    : module_(module), pointerBytes_(pointerBytes)
{
    uint64_t fnAddr = kFunctionBase;
    uint64_t labelAddr = kLabelBase;
    for (const auto &fn : module.functions)
    {
        functions_[fn.name] = &fn;
        functionAddrs_[fn.name] = fnAddr;
        functionsByAddr_[fnAddr] = &fn;
        fnAddr += kCodeStride;
        for (const auto &bb : fn.blocks)
        {
            const std::string key = fn.name + ":" + bb.label;
            labelAddrs_[key] = labelAddr;
            labelsByAddr_[labelAddr] = key;
            labelAddr += kCodeStride;
        }
    }
    for (const auto &ext : module.externs)
    {
        if (functionAddrs_.count(ext.name))
            continue;
        functionAddrs_[ext.name] = fnAddr;
        fnAddr += kCodeStride;
    }
    materializeVTables();
}

void Machine::registerExtern(const std::string &name, ExternFn fn)
{
    externs_[name] = std::move(fn);
}

//===----------------------------------------------------------------------===//
// Memory
//===----------------------------------------------------------------------===//

uint64_t Machine::addressMask() const
{
    return maskBits(~uint64_t{0}, pointerBytes_);
}

uint64_t Machine::allocate(uint64_t bytes, bool zero)
{
    const uint64_t rounded = support::alignUp<uint64_t>(std::max<uint64_t>(bytes, 1), 8);
    if (heap_.size() + rounded > kHeapLimit - kHeapBase)
        throw Trap("out of memory allocating " + std::to_string(bytes) + " bytes");
    const uint64_t address = kHeapBase + heap_.size();
    heap_.resize(heap_.size() + rounded, zero ? uint8_t{0} : kGarbageByte);
    regions_[address] = rounded;
    return address;
}

void Machine::checkRange(uint64_t address, uint64_t bytes) const
{
    auto it = regions_.upper_bound(address);
    if (it == regions_.begin())
        throw Trap("access to unmapped address " + std::to_string(address));
    --it;
    if (address + bytes > it->first + it->second)
        throw Trap("access of " + std::to_string(bytes) + " bytes at " + std::to_string(address) +
                   " overruns its allocation");
}

uint64_t Machine::loadRaw(uint64_t address, unsigned bytes) const
{
    checkRange(address, bytes);
    uint64_t v = 0;
    for (unsigned i = 0; i < bytes; ++i)
        v |= uint64_t{heap_[address - kHeapBase + i]} << (8 * i);
    return v;
}

void Machine::storeRaw(uint64_t address, unsigned bytes, uint64_t value)
{
    checkRange(address, bytes);
    for (unsigned i = 0; i < bytes; ++i)
        heap_[address - kHeapBase + i] = static_cast<uint8_t>(value >> (8 * i));
}

std::vector<uint8_t> Machine::readBytes(uint64_t address, size_t count) const
{
    checkRange(address, count);
    auto first = heap_.begin() + static_cast<std::ptrdiff_t>(address - kHeapBase);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(count));
}

uint64_t Machine::readWord(uint64_t address, unsigned bytes) const
{
    return loadRaw(address, bytes);
}

Slot Machine::loadTyped(Type type, uint64_t address, uint8_t bit) const
{
    Slot s;
    switch (type.kind)
    {
        case Type::Kind::I1:
            s.bits = (loadRaw(address, 1) >> bit) & 1u;
            return s;
        case Type::Kind::F32:
        {
            const auto raw = static_cast<uint32_t>(loadRaw(address, 4));
            float f;
            std::memcpy(&f, &raw, sizeof f);
            s.f64 = f;
            return s;
        }
        case Type::Kind::F64:
        {
            const uint64_t raw = loadRaw(address, 8);
            std::memcpy(&s.f64, &raw, sizeof s.f64);
            return s;
        }
        default:
            s.bits = loadRaw(address, byteWidth(type, pointerBytes_));
            return s;
    }
}

void Machine::storeTyped(Type type, uint64_t address, uint8_t bit, const Slot &value)
{
    const unsigned bytes = byteWidth(type, pointerBytes_);
    ++storeCount_;
    if (storeHook_)
        storeHook_(address, bytes);
    switch (type.kind)
    {
        case Type::Kind::I1:
        {
            uint64_t byte = loadRaw(address, 1);
            const uint64_t mask = uint64_t{1} << bit;
            byte = (value.bits & 1u) ? (byte | mask) : (byte & ~mask);
            storeRaw(address, 1, byte);
            return;
        }
        case Type::Kind::F32:
        {
            const auto f = static_cast<float>(value.f64);
            uint32_t raw;
            std::memcpy(&raw, &f, sizeof raw);
            storeRaw(address, 4, raw);
            return;
        }
        case Type::Kind::F64:
        {
            uint64_t raw;
            std::memcpy(&raw, &value.f64, sizeof raw);
            storeRaw(address, 8, raw);
            return;
        }
        default:
            storeRaw(address, bytes, value.bits);
            return;
    }
}

//===----------------------------------------------------------------------===//
// Symbols
//===----------------------------------------------------------------------===//

void Machine::materializeVTables()
{
    for (const auto &vt : module_.vtables)
        vtables_[vt.symbol] = allocate(vt.sizeBytes, true);

    Frame none;
    for (const auto &vt : module_.vtables)
    {
        const uint64_t base = vtables_.at(vt.symbol);
        for (const auto &slot : vt.slots)
            storeTyped(slot.type, base + slot.offset, 0, eval(none, slot.value));
    }
    storeCount_ = 0;
}

uint64_t Machine::vtableAddress(const std::string &symbol) const
{
    auto it = vtables_.find(symbol);
    if (it == vtables_.end())
        throw Trap("no vtable named '" + symbol + "'");
    return it->second;
}

uint64_t Machine::functionAddress(const std::string &name) const
{
    auto it = functionAddrs_.find(name);
    if (it == functionAddrs_.end())
        throw Trap("no function named '" + name + "'");
    return it->second;
}

uint64_t Machine::labelAddress(const std::string &function, const std::string &label) const
{
    auto it = labelAddrs_.find(function + ":" + label);
    if (it == labelAddrs_.end())
        throw Trap("no block '" + label + "' in @" + function);
    return it->second;
}

Slot Machine::eval(const Frame &fr, const Value &v) const
{
    Slot s;
    switch (v.kind)
    {
        case Value::Kind::Temp:
        {
            auto it = fr.temps.find(v.id);
            if (it == fr.temps.end())
                throw Trap("read of undefined temporary %t" + std::to_string(v.id));
            return it->second;
        }
        case Value::Kind::ConstInt:
            s.bits = static_cast<uint64_t>(v.i64);
            return s;
        case Value::Kind::ConstFloat:
            s.f64 = v.f64;
            return s;
        case Value::Kind::ConstStr:
            s.str = v.str;
            return s;
        case Value::Kind::GlobalAddr:
            if (auto it = vtables_.find(v.str); it != vtables_.end())
                s.bits = it->second;
            else
                s.bits = functionAddress(v.str);
            return s;
        case Value::Kind::NullPtr:
            return s;
        case Value::Kind::BlockAddr:
            s.bits = labelAddress(v.str, v.label);
            return s;
        case Value::Kind::VTableSlot:
            throw Trap("unresolved vtable slot #" + std::to_string(v.id));
    }
    throw Trap("invalid value kind");
}

//===----------------------------------------------------------------------===//
// Execution
//===----------------------------------------------------------------------===//

Slot Machine::run(const std::string &name, const std::vector<Slot> &args)
{
    steps_ = 0;
    return call(name, args);
}

Slot Machine::call(const std::string &callee, const std::vector<Slot> &args)
{
    if (auto it = functions_.find(callee); it != functions_.end() && it->second->hasBody())
        return callFunction(*it->second, args);
    if (auto it = externs_.find(callee); it != externs_.end())
        return it->second(args);
    if (callee == "kiln_alloc")
    {
        if (args.size() != 2)
            throw Trap("kiln_alloc expects 2 arguments");
        const uint64_t address = allocate(args[0].bits, (args[1].bits & 1u) != 0);
        allocations_.push_back({address, args[0].bits});
        return Slot::fromInt(static_cast<int64_t>(address));
    }
    if (callee == "kiln_trap_unreachable")
        throw Trap(args.empty() ? std::string("unreachable") : args[0].str);
    throw Trap("call to undefined function '" + callee + "'");
}

Slot Machine::callAddress(uint64_t address, const std::vector<Slot> &args)
{
    if (auto it = functionsByAddr_.find(address); it != functionsByAddr_.end())
        return call(it->second->name, args);
    for (const auto &[name, addr] : functionAddrs_)
        if (addr == address)
            return call(name, args);
    throw Trap("indirect call to non-code address " + std::to_string(address));
}

Slot Machine::callFunction(const Function &fn, const std::vector<Slot> &args)
{
    if (args.size() != fn.params.size())
        throw Trap("@" + fn.name + " called with " + std::to_string(args.size()) + " arguments");
    Frame fr;
    fr.fn = &fn;
    for (size_t i = 0; i < args.size(); ++i)
        fr.temps[fn.params[i].id] = args[i];

    const BasicBlock *bb = &fn.blocks.front();
    size_t ip = 0;

    auto jump = [&](const std::string &label, const std::vector<Value> &argValues)
    {
        const BasicBlock *target = util::findBlock(fn, label);
        if (!target)
            throw Trap("branch to unknown block '" + label + "' in @" + fn.name);
        if (target->params.size() != argValues.size())
            throw Trap("branch to '" + label + "' passes the wrong number of arguments");
        std::vector<Slot> incoming;
        incoming.reserve(argValues.size());
        for (const auto &a : argValues)
            incoming.push_back(eval(fr, a));
        for (size_t i = 0; i < incoming.size(); ++i)
            fr.temps[target->params[i].id] = std::move(incoming[i]);
        bb = target;
        ip = 0;
    };

    auto normalize = [&](Type type, uint64_t v) -> uint64_t
    {
        switch (type.kind)
        {
            case Type::Kind::I1:
                return v & 1u;
            case Type::Kind::I8:
                return maskBits(v, 1);
            case Type::Kind::I16:
                return maskBits(v, 2);
            case Type::Kind::I32:
                return maskBits(v, 4);
            case Type::Kind::Ptr:
            case Type::Kind::Label:
                return v & addressMask();
            default:
                return v;
        }
    };

    auto define = [&](const Instr &in, Slot value)
    {
        if (in.result)
            fr.temps[*in.result] = std::move(value);
    };

    for (;;)
    {
        if (ip >= bb->instructions.size())
            throw Trap("fell off the end of block '" + bb->label + "' in @" + fn.name);
        const Instr &in = bb->instructions[ip++];
        if (++steps_ > stepLimit_)
            throw Trap("step limit exceeded in @" + fn.name);

        auto operand = [&](size_t i) { return eval(fr, in.operands.at(i)); };

        switch (in.op)
        {
            case Opcode::Add:
            case Opcode::Sub:
            case Opcode::Mul:
            case Opcode::And:
            case Opcode::Or:
            {
                const uint64_t a = operand(0).bits;
                const uint64_t b = operand(1).bits;
                uint64_t r = 0;
                if (in.op == Opcode::Add)
                    r = a + b;
                else if (in.op == Opcode::Sub)
                    r = a - b;
                else if (in.op == Opcode::Mul)
                    r = a * b;
                else if (in.op == Opcode::And)
                    r = a & b;
                else
                    r = a | b;
                Slot s;
                s.bits = normalize(in.type, r);
                define(in, std::move(s));
                break;
            }
            case Opcode::ICmpEq:
            case Opcode::ICmpNe:
            {
                const bool eq = operand(0).bits == operand(1).bits;
                define(in, Slot::fromInt((in.op == Opcode::ICmpEq) == eq ? 1 : 0));
                break;
            }
            case Opcode::Zext:
            case Opcode::Trunc:
            {
                Slot s;
                s.bits = normalize(in.type, operand(0).bits);
                define(in, std::move(s));
                break;
            }
            case Opcode::GEP:
            {
                Slot s;
                s.bits = (operand(0).bits + operand(1).bits) & addressMask();
                define(in, std::move(s));
                break;
            }
            case Opcode::Load:
            {
                const uint64_t address = (operand(0).bits + operand(1).bits) & addressMask();
                define(in, loadTyped(in.type, address, in.MemAttr.bit));
                break;
            }
            case Opcode::Store:
            {
                const uint64_t address = (operand(0).bits + operand(1).bits) & addressMask();
                storeTyped(in.type, address, in.MemAttr.bit, operand(2));
                break;
            }
            case Opcode::MemCopy:
            {
                const uint64_t dst = operand(0).bits;
                const uint64_t src = operand(1).bits;
                const uint64_t bytes = operand(2).bits;
                if (bytes == 0)
                    break;
                checkRange(src, bytes);
                checkRange(dst, bytes);
                ++storeCount_;
                if (storeHook_)
                    storeHook_(dst, static_cast<unsigned>(bytes));
                std::memmove(&heap_[dst - kHeapBase], &heap_[src - kHeapBase], bytes);
                break;
            }
            case Opcode::Call:
            {
                std::vector<Slot> args;
                for (size_t i = 0; i < in.operands.size(); ++i)
                    args.push_back(operand(i));
                define(in, call(in.callee, args));
                break;
            }
            case Opcode::CallIndirect:
            case Opcode::InvokeIndirect:
            {
                const uint64_t target = operand(0).bits;
                std::vector<Slot> args;
                for (size_t i = 1; i < in.operands.size(); ++i)
                    args.push_back(operand(i));
                define(in, callAddress(target, args));
                // Unwinding is not modelled; a trap propagates out of run().
                if (in.op == Opcode::InvokeIndirect)
                    jump(in.labels.at(0), in.brArgs.at(0));
                break;
            }
            case Opcode::Extract:
            {
                const Slot agg = operand(0);
                const auto index = static_cast<size_t>(operand(1).bits);
                if (index >= agg.agg.size())
                    throw Trap("extract of component " + std::to_string(index) + " out of range");
                define(in, agg.agg[index]);
                break;
            }
            case Opcode::Br:
                jump(in.labels.at(0), in.brArgs.at(0));
                break;
            case Opcode::CBr:
            {
                const size_t which = (operand(0).bits & 1u) ? 0 : 1;
                jump(in.labels.at(which), in.brArgs.at(which));
                break;
            }
            case Opcode::SwitchI32:
            {
                const auto scrutinee = static_cast<int32_t>(eval(fr, switchScrutinee(in)).bits);
                size_t chosen = switchCaseCount(in);
                for (size_t i = 0; i < switchCaseCount(in); ++i)
                {
                    if (static_cast<int32_t>(switchCaseValue(in, i).i64) == scrutinee)
                    {
                        chosen = i;
                        break;
                    }
                }
                if (chosen == switchCaseCount(in))
                    jump(switchDefaultLabel(in), in.brArgs.at(0));
                else
                    jump(switchCaseLabel(in, chosen), switchCaseArgs(in, chosen));
                break;
            }
            case Opcode::IndirectBr:
            {
                const uint64_t address = operand(0).bits;
                auto it = labelsByAddr_.find(address);
                if (it == labelsByAddr_.end())
                    throw Trap("indirect branch to non-label address " + std::to_string(address));
                const std::string prefix = fn.name + ":";
                if (it->second.compare(0, prefix.size(), prefix) != 0)
                    throw Trap("indirect branch leaves @" + fn.name);
                const std::string label = it->second.substr(prefix.size());
                if (std::find(in.labels.begin(), in.labels.end(), label) == in.labels.end())
                    throw Trap("indirect branch to undeclared target '" + label + "'");
                jump(label, {});
                break;
            }
            case Opcode::Ret:
            {
                if (in.operands.empty())
                    return Slot{};
                if (fn.retType.kind != Type::Kind::Agg && in.operands.size() == 1)
                    return operand(0);
                Slot s;
                for (size_t i = 0; i < in.operands.size(); ++i)
                    s.agg.push_back(operand(i));
                return s;
            }
            case Opcode::Unreachable:
                throw Trap("reached unreachable in block '" + bb->label + "' of @" + fn.name);
            case Opcode::ObjNew:
            case Opcode::ObjGet:
            case Opcode::ObjSet:
            case Opcode::ObjWith:
            case Opcode::ArrNew:
            case Opcode::ArrAlloc:
            case Opcode::ArrClone:
            case Opcode::ArrGet:
            case Opcode::ArrSet:
            case Opcode::ArrSize:
            case Opcode::ArrHash:
            case Opcode::VCall:
            case Opcode::VInvoke:
            case Opcode::TypeSwitch:
            case Opcode::Freeze:
            case Opcode::Count:
                throw Trap("object-model instruction in @" + fn.name + " was not lowered");
        }
    }
}

} // namespace kiln::vm
