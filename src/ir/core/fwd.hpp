//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Forward declarations for the core IR types. Headers that only need pointer
// or reference types include this file instead of the full definitions.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace kiln::core
{
struct Module;
struct Function;
struct BasicBlock;
struct Instr;
struct Value;
struct ClassDecl;
} // namespace kiln::core
