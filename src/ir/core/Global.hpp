//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Global struct, which represents module-scope
// variables and constants. Besides raw initializer bytes (string literals), a
// global may name the root of a serialized constant object graph; such roots
// are where constant scavenging starts.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Type.hpp"
#include <optional>
#include <string>

namespace kiln::core
{

/// @brief Module-scope variable or constant.
struct Global
{
    /// @brief Identifier of the global within its module.
    std::string name;

    /// @brief Declared IR type of the global.
    Type type;

    /// @brief Serialized initializer data, if any.
    std::string init;

    /// @brief Constant object (see Module::constants) this global points at.
    std::optional<unsigned> constRoot;
};

} // namespace kiln::core
