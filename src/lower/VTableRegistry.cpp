//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements request canonicalisation for the VTable Request Registry.
//
//===----------------------------------------------------------------------===//

#include "lower/VTableRegistry.hpp"

#include "support/internal_error.hpp"

#include <algorithm>

namespace kiln::lower
{

using namespace kiln::core;

std::string VTableRegistry::canonicalKey(Type type, const std::vector<VTableEntry> &entries)
{
    std::string key = type.toString();
    for (const auto &e : entries)
    {
        key += ';';
        key += std::to_string(e.cls);
        key += '=';
        key += std::to_string(static_cast<int>(e.value.kind));
        key += ':';
        key += toString(e.value);
    }
    return key;
}

unsigned VTableRegistry::submit(std::vector<VTableEntry> entries,
                                Type type,
                                const std::string &name,
                                support::SourceLoc loc)
{
    if (entries.empty())
        support::fatal(loc, "vtable request '" + name + "' names no class");
    if (bitWidth(type, 8) == 0)
        support::fatal(loc,
                       "vtable request '" + name + "' has unstorable type " + type.toString());

    std::stable_sort(entries.begin(),
                     entries.end(),
                     [](const VTableEntry &a, const VTableEntry &b) { return a.cls < b.cls; });
    std::vector<VTableEntry> unique;
    unique.reserve(entries.size());
    for (auto &e : entries)
    {
        if (!e.value.isConstant())
            support::fatal(loc, "vtable request '" + name + "' holds a non-constant value");
        if (!unique.empty() && unique.back().cls == e.cls)
        {
            if (unique.back().value != e.value)
                support::fatal(loc,
                               "contradictory vtable entries for class #" + std::to_string(e.cls) +
                                   " in request '" + name + "'");
            continue;
        }
        unique.push_back(std::move(e));
    }

    for (const auto &e : unique)
        classes_.insert(e.cls);

    std::string key = canonicalKey(type, unique);
    if (auto it = index_.find(key); it != index_.end())
        return it->second;

    const unsigned id = static_cast<unsigned>(requests_.size());
    requests_.push_back({id, name, type, std::move(unique)});
    index_.emplace(std::move(key), id);
    return id;
}

} // namespace kiln::lower
