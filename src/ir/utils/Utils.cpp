// File: src/ir/utils/Utils.cpp
// Purpose: Implements miscellaneous IR helper routines.
// Key invariants: Replacement chains are acyclic.
// Ownership/Lifetime: Operates on caller-owned IR.
// Links: ir/utils/Utils.hpp

#include "ir/utils/Utils.hpp"

#include <algorithm>

namespace kiln::util
{

using namespace kiln::core;

unsigned nextTempId(const Function &fn)
{
    unsigned next = 0;
    for (const auto &p : fn.params)
        next = std::max(next, p.id + 1);
    for (const auto &bb : fn.blocks)
    {
        for (const auto &p : bb.params)
            next = std::max(next, p.id + 1);
        for (const auto &in : bb.instructions)
            if (in.result)
                next = std::max(next, *in.result + 1);
    }
    return std::max<unsigned>(next, static_cast<unsigned>(fn.valueNames.size()));
}

BasicBlock *findBlock(Function &fn, const std::string &label)
{
    for (auto &bb : fn.blocks)
        if (bb.label == label)
            return &bb;
    return nullptr;
}

const BasicBlock *findBlock(const Function &fn, const std::string &label)
{
    for (const auto &bb : fn.blocks)
        if (bb.label == label)
            return &bb;
    return nullptr;
}

void forEachValue(Instr &instr, const std::function<void(Value &)> &fn)
{
    for (auto &v : instr.operands)
        fn(v);
    for (auto &args : instr.brArgs)
        for (auto &v : args)
            fn(v);
}

void replaceTemps(Function &fn, const std::unordered_map<unsigned, Value> &replacements)
{
    if (replacements.empty())
        return;
    auto resolve = [&](Value &v)
    {
        while (v.kind == Value::Kind::Temp)
        {
            auto it = replacements.find(v.id);
            if (it == replacements.end())
                break;
            v = it->second;
        }
    };
    for (auto &bb : fn.blocks)
        for (auto &in : bb.instructions)
            forEachValue(in, resolve);
}

size_t countOpcode(const Function &fn, Opcode op)
{
    size_t n = 0;
    for (const auto &bb : fn.blocks)
        n += static_cast<size_t>(std::count_if(bb.instructions.begin(),
                                               bb.instructions.end(),
                                               [op](const Instr &in) { return in.op == op; }));
    return n;
}

} // namespace kiln::util
