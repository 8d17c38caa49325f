//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Function struct, an IR function definition along
// with its parameters and basic blocks.
//
// Functions use SSA form. Each instruction that produces a value is assigned a
// unique temporary ID within its function scope; parameters (function and
// block) occupy the same ID space. A function with no blocks is a declaration
// and is skipped by every transformation.
//
// Ownership Model:
// - Module owns Functions by value in a std::vector
// - Function owns all BasicBlocks, Params, and metadata
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/BasicBlock.hpp"
#include "ir/core/Param.hpp"
#include "ir/core/Type.hpp"
#include <string>
#include <vector>

namespace kiln::core
{

/// @brief Definition of an IR function with parameters and basic blocks.
struct Function
{
    /// Identifier for the function; unique within its Module.
    std::string name;

    /// Return type declared for the function.
    Type retType;

    /// Ordered list of parameters.
    std::vector<Param> params;

    /// Basic blocks comprising the function body; the first block is the entry.
    std::vector<BasicBlock> blocks;

    /// Mapping from SSA value IDs to their original names for diagnostics.
    std::vector<std::string> valueNames;

    /// @brief True when the function carries an implementation.
    [[nodiscard]] bool hasBody() const
    {
        return !blocks.empty();
    }
};

} // namespace kiln::core
