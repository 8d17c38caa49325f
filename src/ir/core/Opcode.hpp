// File: src/ir/core/Opcode.hpp
// Purpose: Enumerates IR instruction opcodes.
// Key invariants: Enumeration order matches Opcode.def.
// Ownership/Lifetime: Not applicable.
// Links: docs/lowering.md
#pragma once

#include <cstddef>
#include <string>

namespace kiln::core
{

enum class Opcode
{
#define KILN_OPCODE(NAME, ...) NAME,
#include "ir/core/Opcode.def"
#undef KILN_OPCODE
    Count
};

constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

std::string toString(Opcode op);

} // namespace kiln::core
