//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Verifier, the public entry point for validating IR
// modules. Verification checks structural rules (every block ends in exactly
// one terminator, labels and temporaries are unique, operands and successors
// resolve, call targets exist, result arity matches the opcode) and, for
// lowered modules, that the object-model layer has been fully eliminated.
//
// The first error encountered stops verification and is returned.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

namespace kiln::core
{
struct Module;
}

namespace kiln::verify
{

/// @brief Pipeline position the module is verified for.
enum class Stage
{
    /// Object-model opcodes allowed; class payloads must be valid.
    HighLevel,
    /// No object-model opcode and no unresolved vtable slot may remain.
    Lowered
};

/// @brief Verifies structural rules for a module.
class Verifier
{
  public:
    [[nodiscard]] static support::Expected<void> verify(const core::Module &m,
                                                        Stage stage = Stage::HighLevel);
};

} // namespace kiln::verify
