// File: src/ir/core/Extern.hpp
// Purpose: Declares external (runtime) function signatures referenced by a module.
// Key invariants: Names unique within the module.
// Ownership/Lifetime: Module owns Extern values.
// Links: lower/RuntimeNames.hpp
#pragma once

#include "ir/core/Type.hpp"
#include <string>
#include <vector>

namespace kiln::core
{

/// @brief External function declaration.
struct Extern
{
    std::string name;
    Type retType;
    std::vector<Type> params;
};

} // namespace kiln::core
