// File: src/lower/LoweringContext.hpp
// Purpose: Module-wide state threaded through every per-function lowering.
// Key invariants: One context per lowerModule invocation; the registry it owns
//                 is complete only after every function has been lowered.
// Ownership/Lifetime: Borrows the module and oracles; owns the registry and
//                     collected diagnostics.
// Links: lower/FunctionLowerer.hpp, lower/VTableRegistry.hpp
#pragma once

#include "ir/core/Module.hpp"
#include "lower/ClassHierarchy.hpp"
#include "lower/Layout.hpp"
#include "lower/LoweringOptions.hpp"
#include "lower/VTableRegistry.hpp"
#include "support/diagnostics.hpp"

#include <ostream>
#include <string>

namespace kiln::lower
{

class LoweringContext
{
  public:
    LoweringContext(core::Module &module,
                    const LoweringOptions &options,
                    const LayoutOracle &layout,
                    const DispatchOracle &dispatch);

    core::Module &module()
    {
        return module_;
    }

    const LoweringOptions &options() const
    {
        return options_;
    }

    const TargetInfo &target() const
    {
        return options_.target;
    }

    const LayoutOracle &layout() const
    {
        return layout_;
    }

    const DispatchOracle &dispatch() const
    {
        return dispatch_;
    }

    VTableRegistry &registry()
    {
        return registry_;
    }

    support::DiagnosticEngine &diagnostics()
    {
        return diags_;
    }

    /// @brief Class declaration for @p id; internal error when unknown.
    const core::ClassDecl &classDecl(core::ClassId id, support::SourceLoc loc) const;

    /// @brief Trace stream, or nullptr when tracing is off.
    std::ostream *trace() const
    {
        return traceStream_;
    }

  private:
    core::Module &module_;
    LoweringOptions options_;
    const LayoutOracle &layout_;
    const DispatchOracle &dispatch_;
    VTableRegistry registry_;
    support::DiagnosticEngine diags_;
    std::ostream *traceStream_ = nullptr;
};

} // namespace kiln::lower
