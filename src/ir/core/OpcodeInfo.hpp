// File: src/ir/core/OpcodeInfo.hpp
// Purpose: Declares metadata describing IR opcode behaviours.
// Key invariants: Table entries cover every Opcode enumerator exactly once.
// Ownership/Lifetime: Metadata is static storage duration and read-only.
// Links: docs/lowering.md
#pragma once

#include "ir/core/Opcode.hpp"

#include <array>
#include <cstdint>

namespace kiln::core
{

/// @brief Result arity expectation for an opcode.
enum class ResultArity : uint8_t
{
    None = 0,       ///< Instruction never produces a result.
    One = 1,        ///< Instruction must produce exactly one result.
    Optional = 0xFF ///< Instruction may omit or provide a result.
};

/// @brief Static description of an opcode's behaviour.
struct OpcodeInfo
{
    const char *name;         ///< Canonical mnemonic.
    ResultArity resultArity;  ///< Expected result arity.
    bool isTerminator;        ///< Instruction ends a basic block.
    bool isObjectModel;       ///< Instruction still knows about classes; removed by lowering.
    bool hasSideEffects;      ///< Instruction mutates state or control flow.
};

extern const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable;

/// @brief Fetch metadata for opcode @p op.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief True when @p op terminates a basic block.
bool isTerminator(Opcode op);

/// @brief True when @p op belongs to the object-aware layer of the IR.
bool isObjectModelOpcode(Opcode op);

} // namespace kiln::core
