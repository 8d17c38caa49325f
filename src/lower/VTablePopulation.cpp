//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Greedy vtable layout and plan materialization.
//
//===----------------------------------------------------------------------===//

#include "lower/VTablePopulation.hpp"

#include "ir/core/Module.hpp"
#include "ir/utils/Utils.hpp"
#include "lower/RuntimeNames.hpp"
#include "support/alignment.hpp"
#include "support/internal_error.hpp"

#include <algorithm>
#include <map>
#include <numeric>

namespace kiln::lower
{

using namespace kiln::core;

uint32_t vtableValueBytes(Type type, unsigned pointerBytes)
{
    const unsigned bits = bitWidth(type, pointerBytes);
    return bits < 8 ? 1u : bits / 8;
}

namespace
{

/// Byte occupancy of one class's vtable under construction.
struct TableState
{
    std::vector<bool> used;
    VTable table;

    bool isFree(uint32_t offset, uint32_t size) const
    {
        for (uint32_t i = offset; i < offset + size; ++i)
            if (i < used.size() && used[i])
                return false;
        return true;
    }

    void take(uint32_t offset, uint32_t size)
    {
        if (used.size() < offset + size)
            used.resize(offset + size, false);
        for (uint32_t i = offset; i < offset + size; ++i)
            used[i] = true;
    }
};

} // namespace

VTablePlan GreedyVTablePopulator::plan(const Module &module,
                                       const VTableRegistry &registry,
                                       unsigned pointerBytes) const
{
    std::map<ClassId, TableState> states;
    auto stateFor = [&](ClassId cls) -> TableState &
    {
        auto [it, inserted] = states.try_emplace(cls);
        if (inserted)
        {
            const ClassDecl *decl = module.findClass(cls);
            if (!decl)
                support::fatal({}, "vtable requested for unknown class #" + std::to_string(cls));
            it->second.table.classId = cls;
            it->second.table.symbol = vtableSymbol(decl->name);
            it->second.table.slots.push_back(
                {0, Type(Type::Kind::I64), Value::constInt(static_cast<long long>(cls))});
            it->second.take(0, kVTableHeaderBytes);
        }
        return it->second;
    };

    for (ClassId cls : registry.classesNeedingVTables())
        stateFor(cls);

    const auto &requests = registry.requests();
    std::vector<unsigned> order(requests.size());
    std::iota(order.begin(), order.end(), 0u);
    std::stable_sort(order.begin(),
                     order.end(),
                     [&](unsigned a, unsigned b)
                     { return requests[a].entries.size() > requests[b].entries.size(); });

    VTablePlan result;
    result.requestOffsets.assign(requests.size(), 0);
    for (unsigned id : order)
    {
        const VTableRequest &req = requests[id];
        const uint32_t size = vtableValueBytes(req.type, pointerBytes);
        uint32_t offset = kVTableHeaderBytes;
        for (;;)
        {
            bool fits = true;
            for (const auto &e : req.entries)
            {
                if (!stateFor(e.cls).isFree(offset, size))
                {
                    fits = false;
                    break;
                }
            }
            if (fits)
                break;
            offset += size;
        }
        for (const auto &e : req.entries)
        {
            TableState &st = stateFor(e.cls);
            st.take(offset, size);
            st.table.slots.push_back({offset, req.type, e.value});
        }
        result.requestOffsets[id] = offset;
    }

    result.tables.reserve(states.size());
    for (auto &[cls, st] : states)
    {
        std::sort(st.table.slots.begin(),
                  st.table.slots.end(),
                  [](const VTableSlot &a, const VTableSlot &b) { return a.offset < b.offset; });
        st.table.sizeBytes =
            support::alignUp<uint32_t>(static_cast<uint32_t>(st.used.size()), kVTableHeaderBytes);
        result.tables.push_back(std::move(st.table));
    }
    return result;
}

size_t applyVTablePlan(Module &module, const VTablePlan &plan)
{
    module.vtables = plan.tables;
    size_t rewritten = 0;
    for (auto &fn : module.functions)
    {
        for (auto &bb : fn.blocks)
        {
            for (auto &in : bb.instructions)
            {
                util::forEachValue(in,
                                   [&](Value &v)
                                   {
                                       if (v.kind != Value::Kind::VTableSlot)
                                           return;
                                       if (v.id >= plan.requestOffsets.size())
                                           support::fatal(in.loc,
                                                          "unknown vtable request #" +
                                                              std::to_string(v.id));
                                       v = Value::constInt(plan.requestOffsets[v.id]);
                                       ++rewritten;
                                   });
            }
        }
    }
    return rewritten;
}

} // namespace kiln::lower
