//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Module struct, the top-level container for an IR
// compilation unit. A Module aggregates the class table, runtime externs,
// globals, the serialized constant object graph, function definitions and,
// once lowering has finished, the materialized vtables.
//
// The Module is designed for simple value semantics. It can be moved
// efficiently but copying is expensive (deep copy of all contained functions).
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Class.hpp"
#include "ir/core/Constant.hpp"
#include "ir/core/Extern.hpp"
#include "ir/core/Function.hpp"
#include "ir/core/Global.hpp"
#include "ir/core/VTable.hpp"
#include "kiln/version.hpp"
#include <string>
#include <vector>

namespace kiln::core
{

/// @brief IR module aggregating classes, externs, globals, constants and functions.
struct Module
{
    /// @brief Module format version string.
    std::string version = KILN_IR_VERSION_STR;

    /// @brief Class table indexed by ClassId (classes[i].id == i).
    std::vector<ClassDecl> classes;

    /// @brief Declared external functions available to the module.
    std::vector<Extern> externs;

    /// @brief Global variable declarations.
    std::vector<Global> globals;

    /// @brief Serialized constant object graph.
    std::vector<ConstObject> constants;

    /// @brief Function definitions contained in the module.
    std::vector<Function> functions;

    /// @brief Materialized dispatch tables; empty before vtable population.
    std::vector<VTable> vtables;

    [[nodiscard]] const ClassDecl *findClass(ClassId id) const;
    [[nodiscard]] const ClassDecl *findClass(const std::string &name) const;
    [[nodiscard]] Function *findFunction(const std::string &name);
    [[nodiscard]] const Function *findFunction(const std::string &name) const;
    [[nodiscard]] const Extern *findExtern(const std::string &name) const;
    [[nodiscard]] const ConstObject *findConstant(unsigned id) const;
    [[nodiscard]] const VTable *findVTable(ClassId id) const;
};

} // namespace kiln::core
