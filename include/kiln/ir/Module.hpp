//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/kiln/ir/Module.hpp
// Purpose: Stable public entry point for IR aggregates, the builder and the verifier.
// Key invariants: Re-exports only supported IR structures.
// Ownership/Lifetime: Types mirror definitions in kiln::core and retain their semantics.
// Links: docs/lowering.md
#pragma once

#include "ir/build/IRBuilder.hpp"
#include "ir/core/BasicBlock.hpp"
#include "ir/core/Class.hpp"
#include "ir/core/Constant.hpp"
#include "ir/core/Function.hpp"
#include "ir/core/Instr.hpp"
#include "ir/core/Module.hpp"
#include "ir/core/Type.hpp"
#include "ir/core/Value.hpp"
#include "ir/io/Serializer.hpp"
#include "ir/verify/Verifier.hpp"
