// File: src/lower/LoweringContext.cpp
// Purpose: Implements construction and lookups of the lowering context.
// Key invariants: Trace stream is resolved once at construction.
// Ownership/Lifetime: See LoweringContext.hpp.
// Links: lower/LoweringContext.hpp

#include "lower/LoweringContext.hpp"

#include "support/internal_error.hpp"

#include <iostream>

namespace kiln::lower
{

LoweringContext::LoweringContext(core::Module &module,
                                 const LoweringOptions &options,
                                 const LayoutOracle &layout,
                                 const DispatchOracle &dispatch)
    : module_(module), options_(options), layout_(layout), dispatch_(dispatch)
{
    if (options_.traceEnabled())
        traceStream_ = options_.traceStream ? options_.traceStream : &std::cerr;
}

const core::ClassDecl &LoweringContext::classDecl(core::ClassId id, support::SourceLoc loc) const
{
    const core::ClassDecl *cls = module_.findClass(id);
    if (!cls)
        support::fatal(loc, "unknown class id " + std::to_string(id));
    return *cls;
}

} // namespace kiln::lower
