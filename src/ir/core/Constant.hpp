// File: src/ir/core/Constant.hpp
// Purpose: Serialized constant object graph emitted alongside code.
// Key invariants: ConstObject ids are unique within a module; references
//                 name existing ConstObjects; the graph may share substructure
//                 and contain cycles.
// Ownership/Lifetime: Module owns ConstObjects by value; references are ids.
// Links: lower/ConstantScavenger.hpp
#pragma once

#include "ir/core/Class.hpp"
#include "ir/core/Value.hpp"

#include <optional>
#include <vector>

namespace kiln::core
{

/// @brief One field (or flattened array element slot) of a constant object.
struct ConstField
{
    /// Scalar payload; ignored when ref is engaged.
    Value value = Value::null();

    /// Reference to another constant object by id.
    std::optional<unsigned> ref;
};

/// @brief Constant instance of a reference class.
struct ConstObject
{
    unsigned id = 0;
    ClassId classId = kNoClass;

    /// Fields in declaration order; arrays store element tuples flattened.
    std::vector<ConstField> fields;
};

} // namespace kiln::core
