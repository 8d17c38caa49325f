//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the object-model lowering driver. lowerModule rewrites
// every function of a module from object-aware IR into raw memory operations,
// then scavenges the constant graph for classes that need vtables and runs
// vtable population so no symbolic slot survives.
//
// Phases, in order:
//   1. Build the default oracles (the class hierarchy is computed from the
//      high-level module before any function is rewritten).
//   2. Lower each function against one shared registry.
//   3. Scavenge constant objects reachable from globals.
//   4. Populate vtables and resolve slot placeholders.
//   5. Optionally verify the result at the lowered stage.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/fwd.hpp"
#include "ir/transform/PassRegistry.hpp"
#include "lower/ClassHierarchy.hpp"
#include "lower/Layout.hpp"
#include "lower/LoweringOptions.hpp"
#include "lower/VTablePopulation.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace kiln::lower
{

/// @brief Optional collaborators; null members select the defaults.
struct LoweringOracles
{
    const LayoutOracle *layout = nullptr;
    const DispatchOracle *dispatch = nullptr;
    const VTablePopulator *populator = nullptr;
};

/// @brief Summary of one lowering run.
struct LoweringReport
{
    size_t functionsLowered = 0;
    size_t requests = 0;
    size_t vtables = 0;
    size_t constantsVisited = 0;
    size_t slotsResolved = 0;
    unsigned unreachableSites = 0;

    /// Notes about call sites and switches lowered to traps.
    std::vector<support::Diagnostic> notes;
};

/// @brief Lower @p module in place.
/// @throws support::InternalError on an input contract violation, or when
///         verification of the result is enabled and fails.
LoweringReport lowerModule(core::Module &module,
                           const LoweringOptions &options = {},
                           const LoweringOracles &oracles = {});

class LowerObjectsPass final : public transform::ModulePass
{
  public:
    explicit LowerObjectsPass(LoweringOptions options = {}) : options_(options) {}

    std::string_view id() const override
    {
        return "lower-objects";
    }

    void run(core::Module &module) override;

    bool lowersObjectModel() const override
    {
        return true;
    }

    [[nodiscard]] const LoweringReport &lastReport() const
    {
        return report_;
    }

  private:
    LoweringOptions options_;
    LoweringReport report_;
};

/// @brief Register "lower-objects" with @p registry.
void registerLowerObjectsPass(transform::PassRegistry &registry,
                              const LoweringOptions &options = {});

} // namespace kiln::lower
