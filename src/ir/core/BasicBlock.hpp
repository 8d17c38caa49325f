//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the BasicBlock struct, a maximal sequence of instructions
// with a single entry point and a single exit terminator. Blocks with
// parameters receive values from predecessor blocks via branch arguments,
// implementing SSA phi-node semantics without explicit phi instructions.
//
// Key Invariants:
// - Labels must be non-empty and unique within the parent function
// - Parameter count and types must match incoming branch arguments
// - If terminated is true, the last instruction must be a terminator opcode
// - All instructions except the last must be non-terminator opcodes
//
// Ownership Model:
// - Function owns BasicBlocks by value in a std::vector
// - BasicBlock owns all Instructions and Params by value
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Instr.hpp"
#include "ir/core/Param.hpp"
#include <string>
#include <vector>

namespace kiln::core
{

/// @brief Sequence of instructions terminated by a control-flow instruction.
struct BasicBlock
{
    /// Identifier for the block within its function.
    std::string label;

    /// Parameters representing incoming SSA values.
    std::vector<Param> params;

    /// Ordered list of instructions belonging to this block.
    std::vector<Instr> instructions;

    /// Indicates whether the block ends with a control-flow instruction.
    bool terminated = false;
};

} // namespace kiln::core
