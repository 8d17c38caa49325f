// File: src/lower/ConstantScavenger.hpp
// Purpose: Collects the classes of every constant object reachable from a global.
// Key invariants: Each constant object is visited once even when shared.
// Ownership/Lifetime: Borrows the module and registry for the duration of the call.
// Links: docs/lowering.md
#pragma once

#include "ir/core/fwd.hpp"
#include "lower/VTableRegistry.hpp"

#include <cstddef>

namespace kiln::lower
{

/// @brief Walk the constant graph from every global naming a constant root and
///        require a vtable for the class of each visited object.
/// @return Number of distinct constant objects visited.
size_t scavengeConstants(const core::Module &module, VTableRegistry &registry);

} // namespace kiln::lower
