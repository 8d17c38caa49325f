//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Instr struct, which represents a single IR
// instruction within a basic block.
//
// The Instr struct uses a flexible design to accommodate the diverse needs of
// different instruction types:
// - Standard operations (add, load, store, etc.) use the operands vector
// - Call instructions additionally store a callee name; virtual calls store the
//   method name there
// - Branch instructions store target labels and per-target arguments
// - Object-model instructions name the class they construct or dispatch on
//   (classId), the classes selecting each type-switch arm (caseClasses), and
//   the fields they read or write (fields)
// - Memory instructions carry MemAttrs (cacheability and sub-byte bit index)
//
// Instructions follow SSA form: each instruction that produces a value assigns
// it to a unique temporary ID within the function scope.
//
// Operand conventions for memory operations:
//   load  <ty> ptr, offset           -> value
//   store <ty> ptr, offset, value
//   gep   ptr, offset                -> ptr
//   memcpy dst, src, bytes
// Offsets are signed byte offsets (constant, temporary, or vtable slot).
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Class.hpp"
#include "ir/core/Opcode.hpp"
#include "ir/core/Type.hpp"
#include "ir/core/Value.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kiln::core
{

/// @brief Attribute container for load and store instructions.
struct MemAttrs
{
    /// @brief The loaded location is immutable once the object is constructed;
    ///        a later common-subexpression pass may reuse earlier loads.
    bool cacheable = false;

    /// @brief Bit index within the addressed byte; only meaningful for i1 accesses.
    uint8_t bit = 0;
};

/// @brief Instruction within a basic block.
struct Instr
{
    /// Destination temporary id; disengaged if the instruction has no result.
    std::optional<unsigned> result;

    /// Operation code selecting semantics.
    Opcode op;

    /// Result type (or accessed type for stores); void when result is absent.
    Type type;

    /// General operands. Size and content depend on opcode.
    std::vector<Value> operands;

    /// Callee name for calls; method name for vcall/vinvoke.
    std::string callee;

    /// Branch target labels.
    std::vector<std::string> labels;

    /// Branch arguments per target; outer vector matches labels in size.
    std::vector<std::vector<Value>> brArgs;

    /// Source location; {0,0,0} denotes unknown.
    kiln::support::SourceLoc loc;

    /// @brief Memory attributes for load/store.
    MemAttrs MemAttr{};

    /// Class constructed, accessed, or statically dispatched on.
    ClassId classId = kNoClass;

    /// Type switch arms: caseClasses[i] selects successor labels[i].
    std::vector<ClassId> caseClasses;

    /// Field names for obj.get / obj.set / obj.with.
    std::vector<std::string> fields;
};

/// @brief Access the scrutinee operand of a switch instruction.
const Value &switchScrutinee(const Instr &instr);

/// @brief Retrieve the default branch label for a switch instruction.
const std::string &switchDefaultLabel(const Instr &instr);

/// @brief Count the number of explicit case arms in a switch instruction.
size_t switchCaseCount(const Instr &instr);

/// @brief Access the value guarding the @p index-th case arm.
const Value &switchCaseValue(const Instr &instr, size_t index);

/// @brief Access the branch label for the @p index-th case arm.
const std::string &switchCaseLabel(const Instr &instr, size_t index);

/// @brief Access the branch arguments for the @p index-th case arm.
const std::vector<Value> &switchCaseArgs(const Instr &instr, size_t index);

} // namespace kiln::core
