// File: src/ir/core/Param.hpp
// Purpose: Defines parameter representation for functions and blocks.
// Key invariants: Type matches associated signature or block.
// Ownership/Lifetime: Parameters stored by value.
// Links: ir/core/Function.hpp, ir/core/BasicBlock.hpp
#pragma once

#include "ir/core/Type.hpp"
#include <string>

namespace kiln::core
{

/// @brief Describes a function or basic block parameter.
struct Param
{
    /// @brief Name used for diagnostics and debugging; may be empty.
    std::string name;

    /// @brief Static type of the parameter.
    Type type;

    /// @brief Temporary id bound to the parameter inside the function.
    unsigned id = 0;
};

} // namespace kiln::core
