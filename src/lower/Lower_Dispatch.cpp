//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lower_Dispatch.cpp
/// @brief Virtual calls and runtime type switches lowered to vtable loads.
///
/// Every dispatch decision becomes a per-class value stored in the vtable:
/// a method entry point for calls, and for type switches either the varying
/// branch arguments, a boolean, a block address or a dense successor index.
/// The slot holding the value is a symbolic request; its byte offset is
/// assigned once the whole module has been lowered.
///
//===----------------------------------------------------------------------===//

#include "lower/FunctionLowerer.hpp"

#include "ir/core/Module.hpp"
#include "lower/RuntimeNames.hpp"
#include "support/diag_expected.hpp"
#include "support/internal_error.hpp"

#include <algorithm>
#include <map>

namespace kiln::lower
{

using namespace kiln::core;
using support::fatal;
using support::SourceLoc;

namespace
{

struct Successor
{
    std::string label;
    std::vector<Value> args;
};

bool sameSuccessor(const Successor &a, const Successor &b)
{
    return a.label == b.label && a.args == b.args;
}

/// Narrowest integer type able to hold indices 0..count-1.
Type indexType(size_t count)
{
    if (count <= (1u << 8))
        return Type(Type::Kind::I8);
    if (count <= (1u << 16))
        return Type(Type::Kind::I16);
    return Type(Type::Kind::I32);
}

MemAttrs cacheableLoad()
{
    MemAttrs attrs;
    attrs.cacheable = true;
    return attrs;
}

} // namespace

Value FunctionLowerer::loadVTable(Value obj)
{
    const Type ptr(Type::Kind::Ptr);
    Value word = b_.load(ptr, std::move(obj), Value::constInt(-static_cast<int64_t>(ptrBytes_)));
    return b_.andBits(ptr, word, Value::constInt(~kFrozenFlag));
}

void FunctionLowerer::emitUnreachableTrap(const std::string &message, Value subject, SourceLoc loc)
{
    b_.call(kRtTrapUnreachable,
            Type(Type::Kind::Void),
            {Value::constStr(message), std::move(subject)});
    b_.unreachable();
    ++unreachableSites_;
    ctx_.diagnostics().report(support::makeNote(loc, message));
    if (std::ostream *os = ctx_.trace())
        *os << "[lower] @" << fn_.name << ": unreachable trap: " << message << "\n";
}

//===----------------------------------------------------------------------===//
// Virtual calls
//===----------------------------------------------------------------------===//

void FunctionLowerer::lowerVirtualCall(const Instr &in)
{
    if (in.operands.empty())
        fatal(in.loc, "virtual call to '" + in.callee + "' without a receiver");
    const Value &receiver = in.operands.front();
    const bool isInvoke = in.op == Opcode::VInvoke;

    const std::vector<Implementation> impls = ctx_.dispatch().allImplementations(in);
    for (const auto &impl : impls)
    {
        const ClassDecl &cls = ctx_.classDecl(impl.cls, in.loc);
        if (!cls.isReference())
            fatal(in.loc,
                  "virtual call to '" + in.callee + "' reaches value class '" + cls.name +
                      "'; it should have been devirtualized");
    }

    if (impls.empty())
    {
        std::string owner = in.classId == kNoClass ? std::string("<unknown>")
                                                   : ctx_.classDecl(in.classId, in.loc).name;
        emitUnreachableTrap(
            "no implementation of '" + owner + "." + in.callee + "' is instantiated",
            receiver,
            in.loc);
        if (in.result)
        {
            if (hasScalarRepresentation(in.type))
                replacements_[*in.result] = zeroValue(in.type, in.loc);
            unreachable_.insert(*in.result);
        }
        if (!isInvoke)
            continueIn(b_.createUniqueBlock(currentLabel() + ".dead").label, in.loc);
        return;
    }

    std::vector<VTableEntry> entries;
    entries.reserve(impls.size());
    for (const auto &impl : impls)
        entries.push_back({impl.cls, Value::global(impl.entry)});
    const unsigned req =
        ctx_.registry().submit(std::move(entries), Type(Type::Kind::Ptr), in.callee, in.loc);

    Value vtable = loadVTable(receiver);
    Value target = b_.load(Type(Type::Kind::Ptr), vtable, Value::vtableSlot(req), cacheableLoad());
    if (isInvoke)
    {
        if (in.labels.size() != 2)
            fatal(in.loc, "vinvoke of '" + in.callee + "' needs normal and unwind successors");
        b_.invokeIndirect(in.type, target, in.operands, in.result, in.labels[0], in.labels[1]);
    }
    else
    {
        b_.callIndirect(in.type, target, in.operands, in.result);
    }

    if (std::ostream *os = ctx_.trace())
        *os << "[lower] @" << fn_.name << ": vcall " << in.callee << " -> request #" << req
            << " (" << impls.size() << " classes)\n";
}

void FunctionLowerer::lowerExtract(Instr in)
{
    if (in.operands.empty() || !in.result)
        fatal(in.loc, "malformed extract");
    const Value &agg = in.operands.front();
    const bool dead =
        agg.kind == Value::Kind::Temp ? unreachable_.count(agg.id) != 0 : agg.isConstant();
    if (dead)
    {
        replacements_[*in.result] = zeroValue(in.type, in.loc);
        return;
    }
    b_.append(std::move(in));
}

//===----------------------------------------------------------------------===//
// Type switches
//===----------------------------------------------------------------------===//

void FunctionLowerer::lowerTypeSwitch(const Instr &in)
{
    if (in.operands.size() != 1 || in.caseClasses.size() != in.labels.size() ||
        in.brArgs.size() != in.labels.size())
        fatal(in.loc, "malformed typeswitch");
    const Value &subject = in.operands.front();
    const ClassDecl &staticCls = ctx_.classDecl(in.classId, in.loc);

    for (ClassId c : in.caseClasses)
    {
        const ClassDecl &cls = ctx_.classDecl(c, in.loc);
        if (!cls.isReference())
            fatal(in.loc,
                  "typeswitch case '" + cls.name +
                      "' is a value class; it should have been resolved statically");
    }

    const std::vector<ClassId> concrete = ctx_.dispatch().concreteSubclasses(in.classId);
    if (concrete.empty())
    {
        emitUnreachableTrap(
            "type switch over '" + staticCls.name + "' with no instantiated subclass",
            subject,
            in.loc);
        return;
    }

    // Successor chosen by every concrete class, and the distinct successors
    // in case order.
    std::map<ClassId, size_t> caseOf;
    for (ClassId c : concrete)
    {
        const ClassDecl &cls = ctx_.classDecl(c, in.loc);
        if (!cls.isReference())
            fatal(in.loc,
                  "typeswitch over '" + staticCls.name + "' reaches value class '" + cls.name +
                      "'");
        const size_t idx = ctx_.dispatch().findTypeSwitchSuccessor(c, in.caseClasses);
        if (idx >= in.labels.size())
            fatal(in.loc, "typeswitch has no case for class '" + cls.name + "'");
        caseOf[c] = idx;
    }

    std::vector<size_t> usedCases;
    for (const auto &[cls, idx] : caseOf)
        usedCases.push_back(idx);
    std::sort(usedCases.begin(), usedCases.end());
    usedCases.erase(std::unique(usedCases.begin(), usedCases.end()), usedCases.end());

    std::vector<Successor> distinct;
    std::vector<size_t> successorOfCase(in.labels.size(), 0);
    for (size_t idx : usedCases)
    {
        Successor s{in.labels[idx], in.brArgs[idx]};
        auto it = std::find_if(distinct.begin(),
                               distinct.end(),
                               [&](const Successor &d) { return sameSuccessor(d, s); });
        successorOfCase[idx] = static_cast<size_t>(it - distinct.begin());
        if (it == distinct.end())
            distinct.push_back(std::move(s));
    }

    auto trace = [&](int strategy)
    {
        if (std::ostream *os = ctx_.trace())
            *os << "[lower] @" << fn_.name << ": typeswitch over " << staticCls.name
                << " -> strategy " << strategy << " (" << concrete.size() << " classes, "
                << distinct.size() << " successors)\n";
    };

    // Strategy 1: one target block; varying arguments come from the vtable.
    const bool oneTarget = std::all_of(distinct.begin(),
                                       distinct.end(),
                                       [&](const Successor &s)
                                       { return s.label == distinct.front().label; });
    if (oneTarget)
    {
        const std::string &target = distinct.front().label;
        const size_t arity = distinct.front().args.size();
        auto paramTypes = blockParamTypes_.find(target);
        std::vector<size_t> varying;
        for (size_t j = 0; j < arity; ++j)
        {
            for (const auto &s : distinct)
            {
                if (s.args.size() != arity)
                    fatal(in.loc,
                          "typeswitch successors pass different argument counts to '" + target +
                              "'");
                if (s.args[j] != distinct.front().args[j])
                {
                    varying.push_back(j);
                    break;
                }
            }
        }
        bool loadable = true;
        for (size_t j : varying)
        {
            for (const auto &s : distinct)
                if (!s.args[j].isConstant())
                    loadable = false;
            if (paramTypes == blockParamTypes_.end() || j >= paramTypes->second.size() ||
                !hasScalarRepresentation(paramTypes->second[j]))
                loadable = false;
        }

        if (loadable)
        {
            std::vector<Value> args = distinct.front().args;
            Value vtable = Value::null();
            if (!varying.empty())
                vtable = loadVTable(subject);
            for (size_t j : varying)
            {
                std::vector<VTableEntry> entries;
                for (const auto &[cls, idx] : caseOf)
                    entries.push_back({cls, in.brArgs[idx][j]});
                const Type ty = paramTypes->second[j];
                const std::string name =
                    staticCls.name + ".switch." + target + "." + std::to_string(j);
                const unsigned req = ctx_.registry().submit(std::move(entries), ty, name, in.loc);
                args[j] = b_.load(ty, vtable, Value::vtableSlot(req), cacheableLoad());
            }
            b_.br(target, args);
            trace(1);
            return;
        }
    }

    // Strategy 2: two successors, one boolean per class.
    if (distinct.size() == 2)
    {
        std::vector<VTableEntry> entries;
        for (const auto &[cls, idx] : caseOf)
            entries.push_back({cls, Value::constBool(successorOfCase[idx] == 0)});
        const unsigned req = ctx_.registry().submit(
            std::move(entries), Type(Type::Kind::I1), staticCls.name + ".switch.bool", in.loc);
        Value vtable = loadVTable(subject);
        Value cond = b_.load(Type(Type::Kind::I1), vtable, Value::vtableSlot(req), cacheableLoad());
        b_.cbr(cond, distinct[0].label, distinct[0].args, distinct[1].label, distinct[1].args);
        trace(2);
        return;
    }

    // Strategy 3: computed jump, or a dense switch where the target has none.
    const std::string here = currentLabel();
    if (ctx_.target().supportsIndirectBranch)
    {
        std::vector<std::string> targets;
        targets.reserve(distinct.size());
        for (const auto &s : distinct)
        {
            if (s.args.empty())
            {
                targets.push_back(s.label);
                continue;
            }
            BasicBlock &tramp = b_.createUniqueBlock(here + ".to." + s.label);
            const std::string trampLabel = tramp.label;
            b_.setInsertPoint(tramp);
            b_.br(s.label, s.args);
            targets.push_back(trampLabel);
        }
        continueIn(here, in.loc);

        std::vector<VTableEntry> entries;
        for (const auto &[cls, idx] : caseOf)
            entries.push_back({cls, Value::blockAddr(fn_.name, targets[successorOfCase[idx]])});
        const unsigned req = ctx_.registry().submit(
            std::move(entries), Type(Type::Kind::Label), staticCls.name + ".switch.label", in.loc);
        Value vtable = loadVTable(subject);
        Value addr =
            b_.load(Type(Type::Kind::Label), vtable, Value::vtableSlot(req), cacheableLoad());
        b_.indirectBr(addr, targets);
        trace(3);
        return;
    }

    BasicBlock &fallback = b_.createUniqueBlock(here + ".switch.default");
    const std::string defaultLabel = fallback.label;
    b_.setInsertPoint(fallback);
    b_.unreachable();
    continueIn(here, in.loc);

    const Type idxTy = indexType(distinct.size());
    std::vector<VTableEntry> entries;
    for (const auto &[cls, idx] : caseOf)
        entries.push_back({cls, Value::constInt(static_cast<long long>(successorOfCase[idx]))});
    const unsigned req =
        ctx_.registry().submit(std::move(entries), idxTy, staticCls.name + ".switch.index", in.loc);
    Value vtable = loadVTable(subject);
    Value index = b_.load(idxTy, vtable, Value::vtableSlot(req), cacheableLoad());
    if (idxTy.kind != Type::Kind::I32)
        index = b_.zext(Type(Type::Kind::I32), index);

    std::vector<long long> values;
    std::vector<std::string> labels;
    std::vector<std::vector<Value>> args;
    for (size_t i = 0; i < distinct.size(); ++i)
    {
        values.push_back(static_cast<long long>(i));
        labels.push_back(distinct[i].label);
        args.push_back(distinct[i].args);
    }
    b_.switchI32(index, defaultLabel, values, labels, args);
    trace(3);
}

} // namespace kiln::lower
