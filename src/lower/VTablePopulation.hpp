//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares vtable population: once every function has been lowered
// the registry holds the final set of requests and classes, and a populator
// assigns each request a byte offset valid in the vtable of every class it
// names. The resulting plan is materialized into Module::vtables and every
// vtable-slot placeholder in the module is rewritten to its offset.
//
// Each vtable starts with an 8-byte header holding the class id, so offset 0
// is never handed out to a request.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/VTable.hpp"
#include "ir/core/fwd.hpp"
#include "lower/VTableRegistry.hpp"

#include <cstdint>
#include <vector>

namespace kiln::lower
{

struct VTablePlan
{
    /// Byte offset assigned to each request, indexed by request id.
    std::vector<uint32_t> requestOffsets;

    /// One table per class needing a vtable, ordered by class id.
    std::vector<core::VTable> tables;
};

class VTablePopulator
{
  public:
    virtual ~VTablePopulator() = default;

    /// @brief Lay out every vtable the registry asks for.
    virtual VTablePlan plan(const core::Module &module,
                            const VTableRegistry &registry,
                            unsigned pointerBytes) const = 0;
};

/// @brief First-fit placement, largest requests (by class count) first.
class GreedyVTablePopulator final : public VTablePopulator
{
  public:
    VTablePlan plan(const core::Module &module,
                    const VTableRegistry &registry,
                    unsigned pointerBytes) const override;
};

/// @brief Byte size of a vtable value of type @p type.
uint32_t vtableValueBytes(core::Type type, unsigned pointerBytes);

/// @brief Store @p plan into @p module and resolve every vtable-slot operand.
/// @return Number of operands rewritten.
size_t applyVTablePlan(core::Module &module, const VTablePlan &plan);

} // namespace kiln::lower
