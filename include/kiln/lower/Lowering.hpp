//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/kiln/lower/Lowering.hpp
// Purpose: Stable public entry point for object-model lowering.
// Key invariants: Re-exports the driver, its options and the oracle seams only.
// Ownership/Lifetime: Callers own the module and any oracle they pass in.
// Links: docs/lowering.md
#pragma once

#include "lower/ClassHierarchy.hpp"
#include "lower/Layout.hpp"
#include "lower/LowerObjects.hpp"
#include "lower/LoweringOptions.hpp"
#include "lower/VTablePopulation.hpp"
