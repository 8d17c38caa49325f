//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Serializer class, which converts IR modules to their
// textual representation for debugging, pass-manager instrumentation and
// trace output. The format covers both the object-model layer (class table,
// constants, obj.* / arr.* / vcall / typeswitch / freeze) and the lowered
// layer (vtables, loads and stores with memory attributes).
//
// The Serializer is stateless and thread-safe.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/fwd.hpp"
#include <ostream>
#include <string>

namespace kiln::io
{

/// @brief Serializes IR modules to their textual form.
class Serializer
{
  public:
    /// @brief Write @p m to @p os.
    static void write(const core::Module &m, std::ostream &os);

    /// @brief Write a single function of @p m to @p os.
    static void writeFunction(const core::Module &m, const core::Function &fn, std::ostream &os);

    /// @brief Render a single instruction (without trailing newline).
    static std::string instrToString(const core::Module &m, const core::Instr &instr);

    /// @brief Serialize @p m to a string.
    static std::string toString(const core::Module &m);
};

} // namespace kiln::io
