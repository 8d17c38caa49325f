// File: src/ir/utils/Utils.hpp
// Purpose: Miscellaneous IR helper routines shared by passes and tests.
// Key invariants: Functions operate on existing instructions and blocks.
// Ownership/Lifetime: Does not take ownership of inputs.
// Links: ir/core/Function.hpp
#pragma once

#include "ir/core/BasicBlock.hpp"
#include "ir/core/Function.hpp"
#include "ir/core/Instr.hpp"

#include <functional>
#include <string>
#include <unordered_map>

namespace kiln::util
{

/// @brief First temporary id not used by any parameter or result in @p fn.
unsigned nextTempId(const core::Function &fn);

/// @brief Locate block @p label in @p fn; nullptr when absent.
core::BasicBlock *findBlock(core::Function &fn, const std::string &label);
const core::BasicBlock *findBlock(const core::Function &fn, const std::string &label);

/// @brief Invoke @p fn on every operand and branch argument of @p instr.
void forEachValue(core::Instr &instr, const std::function<void(core::Value &)> &fn);

/// @brief Rewrite every temporary operand of @p fn through @p replacements.
/// @details Chains are followed transitively, so a temporary replaced by a
///          temporary that is itself replaced ends at the final value.
void replaceTemps(core::Function &fn, const std::unordered_map<unsigned, core::Value> &replacements);

/// @brief Count instructions with opcode @p op in @p fn.
size_t countOpcode(const core::Function &fn, core::Opcode op);

} // namespace kiln::util
