// File: src/lower/LoweringOptions.hpp
// Purpose: Configuration of the object lowering pass and the target
//          capabilities it queries.
// Key invariants: pointerBytes is 4 or 8.
// Ownership/Lifetime: Plain value types.
// Links: lower/LowerObjects.hpp
#pragma once

#include <cstdlib>
#include <ostream>

namespace kiln::lower
{

/// @brief Capabilities of the execution environment the module is lowered for.
struct TargetInfo
{
    /// Size of a pointer (and of the vtable word) in bytes.
    unsigned pointerBytes = 8;

    /// Target can jump to a code address loaded from memory.
    bool supportsIndirectBranch = true;

    /// @brief Defaults for the machine running the compiler.
    static TargetInfo host()
    {
        TargetInfo info;
        info.pointerBytes = static_cast<unsigned>(sizeof(void *));
        info.supportsIndirectBranch = true;
        return info;
    }
};

/// @brief User-visible knobs for lowerModule.
struct LoweringOptions
{
    /// Print one line per lowered dispatch site, request and split block.
    bool trace = false;

    /// Run the verifier on the lowered module and fail on violations.
    bool verify = true;

    /// Stream receiving trace output; std::cerr when null.
    std::ostream *traceStream = nullptr;

    TargetInfo target = TargetInfo::host();

    /// @brief True when tracing was requested here or via KILN_LOWER_TRACE.
    [[nodiscard]] bool traceEnabled() const
    {
        static const bool envTrace = std::getenv("KILN_LOWER_TRACE") != nullptr;
        return trace || envTrace;
    }
};

} // namespace kiln::lower
