// File: src/lower/ConstantScavenger.cpp
// Purpose: Work-list walk over the serialized constant graph.
// Key invariants: Dangling constant references are internal errors.
// Ownership/Lifetime: No state outlives the call.
// Links: docs/lowering.md

#include "lower/ConstantScavenger.hpp"

#include "ir/core/Module.hpp"
#include "support/internal_error.hpp"

#include <unordered_set>
#include <vector>

namespace kiln::lower
{

using namespace kiln::core;

size_t scavengeConstants(const Module &module, VTableRegistry &registry)
{
    std::vector<unsigned> work;
    std::unordered_set<unsigned> seen;
    for (const auto &g : module.globals)
        if (g.constRoot && seen.insert(*g.constRoot).second)
            work.push_back(*g.constRoot);

    while (!work.empty())
    {
        const unsigned id = work.back();
        work.pop_back();
        const ConstObject *obj = module.findConstant(id);
        if (!obj)
            support::fatal({}, "reference to unknown constant #" + std::to_string(id));
        registry.requireVTable(obj->classId);
        for (const auto &field : obj->fields)
            if (field.ref && seen.insert(*field.ref).second)
                work.push_back(*field.ref);
    }
    return seen.size();
}

} // namespace kiln::lower
