//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Value struct, which represents operands and constants
// in IR instructions. Values are tagged unions that can hold temporaries,
// literal constants, global addresses, code-label constants, or the symbolic
// placeholder for a vtable slot that has been requested but not yet placed.
//
// Supported Value Kinds:
// - Temp: SSA temporary reference (%t0, %t1, etc.)
// - ConstInt: Integer literal; isBool marks i1 literals
// - ConstFloat: Floating-point literal
// - ConstStr: String literal ("hello")
// - GlobalAddr: Address of global symbol (@name); also function entry points
// - NullPtr: Null pointer constant
// - BlockAddr: Address of a block label inside a function (computed jumps)
// - VTableSlot: Byte offset of a vtable request, resolved by vtable population
//
// Values are plain copyable structs. Factory methods construct Values with the
// appropriate kind and payload so callers never pair a discriminant with the
// wrong payload field.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace kiln::core
{

/// @brief Tagged value used as operands and results in the IR.
struct Value
{
    /// @brief Enumerates the different value forms.
    enum class Kind
    {
        Temp,
        ConstInt,
        ConstFloat,
        ConstStr,
        GlobalAddr,
        NullPtr,
        BlockAddr,
        VTableSlot
    };

    /// Discriminant selecting which payload is active.
    Kind kind;

    /// Integer payload used when kind == Kind::ConstInt.
    long long i64{0};

    /// Floating-point payload used when kind == Kind::ConstFloat.
    double f64{0.0};

    /// Temporary identifier (Kind::Temp) or request identifier (Kind::VTableSlot).
    unsigned id{0};

    /// String payload: string constants, global names, and the owning
    /// function of a block address.
    std::string str;

    /// Block label for Kind::BlockAddr.
    std::string label;

    /// @brief Flag set when the integer literal represents an i1 boolean.
    /// @invariant Only meaningful when kind == Kind::ConstInt.
    bool isBool{false};

    static Value temp(unsigned t);

    static Value constInt(long long v);

    static Value constBool(bool v);

    static Value constFloat(double v);

    static Value constStr(std::string s);

    static Value global(std::string s);

    static Value null();

    /// @brief Construct the address of block @p label in function @p function.
    static Value blockAddr(std::string function, std::string label);

    /// @brief Construct the placeholder for the byte offset of vtable request @p request.
    static Value vtableSlot(unsigned request);

    /// @brief True for every kind except Temp.
    [[nodiscard]] bool isConstant() const
    {
        return kind != Kind::Temp;
    }

    /// @brief True when the literal is known to have an all-zero bit pattern.
    /// @details Covers integer zero, false, positive 0.0 and null.
    [[nodiscard]] bool isZeroBits() const;
};

/// @brief Structural equality over kind and active payload.
bool operator==(const Value &a, const Value &b);

inline bool operator!=(const Value &a, const Value &b)
{
    return !(a == b);
}

std::string toString(const Value &v);

} // namespace kiln::core
