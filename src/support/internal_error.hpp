//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/internal_error.hpp
// Purpose: Declares the exception raised for compiler-internal invariant
//          violations and the helper used to raise it.
// Key invariants: fatal() never returns; the thrown InternalError always
//                 carries an error-severity diagnostic.
// Ownership/Lifetime: Exceptions own a copy of their diagnostic.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <stdexcept>
#include <string>

namespace kiln::support
{

/// @brief Unrecoverable failure caused by malformed input from an earlier pass.
/// @details what() returns the fully formatted, position-tagged message.
class InternalError : public std::logic_error
{
  public:
    explicit InternalError(Diagnostic diag);

    /// @brief Structured diagnostic describing the violation.
    const Diagnostic &diagnostic() const noexcept
    {
        return diag_;
    }

  private:
    Diagnostic diag_;
};

/// @brief Abort compilation with a position-tagged message.
[[noreturn]] void fatal(SourceLoc loc, const std::string &message);

} // namespace kiln::support
