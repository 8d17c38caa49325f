//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the class table entries that make the upper layer of the
// IR object-model aware. A ClassDecl describes one source-level class: whether
// its values live behind a reference (and therefore carry a vtable pointer) or
// are unboxed value aggregates, whether instances are plain objects or arrays,
// its declared fields in declaration order, the methods it implements, and a
// summary of how freezing interacts with its instances.
//
// Class identifiers are dense indices assigned by the frontend. Field bit
// offsets are NOT recorded here; they are computed by a LayoutOracle.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kiln::core
{

using ClassId = uint32_t;

/// @brief Sentinel used by instructions that carry no class payload.
inline constexpr ClassId kNoClass = UINT32_MAX;

/// @brief Storage strategy of a class's values.
enum class ClassKind
{
    Reference, ///< Heap allocated, addressed by pointer, carries a vtable pointer.
    Value      ///< Unboxed scalar or aggregate; never reaches the lowering pass.
};

/// @brief Instance shape of a reference class.
enum class ClassShape
{
    Object, ///< Fixed set of named fields.
    Array   ///< Counted sequence of element tuples.
};

/// @brief What the static type of a value proves about deep immutability.
enum class Mutability
{
    DeepImmutable, ///< Every instance is already deeply immutable.
    Mutable,       ///< Instances are never frozen before an explicit freeze.
    MaybeFrozen    ///< An instance may already be frozen (possibly read-only storage).
};

/// @brief One declared field (object) or tuple element (array element).
struct FieldDecl
{
    std::string name;
    Type type;
};

/// @brief Method implemented by a class.
struct MethodDecl
{
    /// Method name used by virtual call sites.
    std::string name;
    /// Symbol of the function implementing the method.
    std::string entry;
};

/// @brief Class table entry.
struct ClassDecl
{
    ClassId id = kNoClass;
    std::string name;
    ClassKind kind = ClassKind::Reference;
    ClassShape shape = ClassShape::Object;

    /// Abstract classes have no instances of their own.
    bool isAbstract = false;

    /// Direct superclass, if any.
    std::optional<ClassId> parent;

    /// Declared fields in declaration order; for arrays, the element tuple.
    std::vector<FieldDecl> fields;

    /// Methods implemented or overridden by this class.
    std::vector<MethodDecl> methods;

    Mutability mutability = Mutability::Mutable;

    [[nodiscard]] bool isReference() const
    {
        return kind == ClassKind::Reference;
    }

    [[nodiscard]] bool isArray() const
    {
        return shape == ClassShape::Array;
    }

    /// @brief Look up a method declared directly on this class.
    [[nodiscard]] const MethodDecl *findMethod(const std::string &methodName) const;
};

} // namespace kiln::core
