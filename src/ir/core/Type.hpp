// File: src/ir/core/Type.hpp
// Purpose: Declares IR type representation.
// Key invariants: Kind field determines payload.
// Ownership/Lifetime: Types are lightweight values.
// Links: docs/lowering.md
#pragma once

#include <string>

namespace kiln::core
{

/// @brief Simple type wrapper for IR primitive types.
struct Type
{
    /// @brief Enumerates primitive IR types.
    enum class Kind
    {
        Void,
        I1,
        I8,
        I16,
        I32,
        I64,
        F32,
        F64,
        Ptr,
        Label,
        Str,
        Agg
    };

    Kind kind; ///< Discriminator specifying the active kind

    /// @brief Construct a type of kind @p k.
    explicit Type(Kind k = Kind::Void);

    /// @brief Convert type to string representation.
    std::string toString() const;

    bool operator==(const Type &other) const
    {
        return kind == other.kind;
    }

    bool operator!=(const Type &other) const
    {
        return kind != other.kind;
    }
};

/// @brief Convert kind @p k to its mnemonic string.
std::string kindToString(Type::Kind k);

/// @brief Storage width of @p type in bits.
/// @param pointerBytes Size of ptr and label values on the current target.
/// @return 0 for types without a memory representation (void, str, agg).
unsigned bitWidth(Type type, unsigned pointerBytes);

/// @brief True when @p type has a scalar value that can be materialized as a constant.
bool hasScalarRepresentation(Type type);

/// @brief True for the integer kinds i1 through i64.
bool isInteger(Type type);

} // namespace kiln::core
