//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the VTable Request Registry. Every dispatch site that
// needs per-class data (a method entry point, a branch selector, a code label,
// a constant block argument) submits a request: one value per concrete class,
// all of one type. The request is assigned an id whose byte offset inside each
// named class's vtable is decided later by vtable population; until then code
// refers to it through a Value::vtableSlot placeholder.
//
// Requests are canonicalised: entries are sorted by class id and a request
// whose (type, class, value) set equals an earlier one returns the earlier id.
// Many call sites of the same virtual method therefore share one slot.
//
// The registry also accumulates the set of classes that need a vtable at all.
// One registry lives for the whole module; it is not synchronised.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Class.hpp"
#include "ir/core/Type.hpp"
#include "ir/core/Value.hpp"
#include "support/source_location.hpp"

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln::lower
{

/// @brief Value class @c cls exposes at a request's slot.
struct VTableEntry
{
    core::ClassId cls = core::kNoClass;
    core::Value value = core::Value::null();
};

/// @brief Canonical registered request.
struct VTableRequest
{
    unsigned id = 0;

    /// Name of the first submission; informational only.
    std::string name;

    core::Type type;

    /// Entries sorted by class id, one per class.
    std::vector<VTableEntry> entries;
};

class VTableRegistry
{
  public:
    /// @brief Register (or find) the request described by @p entries.
    /// @param entries One value per class; a class may repeat only with the same value.
    /// @param type Type of every value.
    /// @param name Human readable name used in traces.
    /// @param loc Location reported on contract violations.
    /// @return Id of the canonical request.
    unsigned submit(std::vector<VTableEntry> entries,
                    core::Type type,
                    const std::string &name,
                    support::SourceLoc loc);

    /// @brief Record that @p cls needs a vtable even if no request names it.
    void requireVTable(core::ClassId cls)
    {
        classes_.insert(cls);
    }

    [[nodiscard]] const std::vector<VTableRequest> &requests() const
    {
        return requests_;
    }

    [[nodiscard]] const std::set<core::ClassId> &classesNeedingVTables() const
    {
        return classes_;
    }

    [[nodiscard]] const VTableRequest &request(unsigned id) const
    {
        return requests_.at(id);
    }

  private:
    std::vector<VTableRequest> requests_;
    std::unordered_map<std::string, unsigned> index_;
    std::set<core::ClassId> classes_;

    static std::string canonicalKey(core::Type type, const std::vector<VTableEntry> &entries);
};

} // namespace kiln::lower
