//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the helper constructors and formatting routines that accompany the
// lightweight IR value type.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements convenience constructors and printers for IR values.
/// @details The textual spelling produced by @ref toString is also used as the
///          canonical key when vtable requests are deduplicated, so every
///          payload that distinguishes two values must appear in it.

#include "ir/core/Value.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace kiln::core
{

Value Value::temp(unsigned t)
{
    Value v{Kind::Temp};
    v.id = t;
    return v;
}

/// @brief Create a signed integer constant value.
/// @details Preserves the exact @c long long bit pattern so two's-complement
///          wraparound semantics are maintained when consumed by later stages.
Value Value::constInt(long long v)
{
    Value out{Kind::ConstInt};
    out.i64 = v;
    return out;
}

/// @brief Create a boolean literal backed by the integer constant encoding.
Value Value::constBool(bool v)
{
    Value out{Kind::ConstInt};
    out.i64 = v ? 1 : 0;
    out.isBool = true;
    return out;
}

Value Value::constFloat(double v)
{
    Value out{Kind::ConstFloat};
    out.f64 = v;
    return out;
}

Value Value::constStr(std::string s)
{
    Value out{Kind::ConstStr};
    out.str = std::move(s);
    return out;
}

Value Value::global(std::string s)
{
    Value out{Kind::GlobalAddr};
    out.str = std::move(s);
    return out;
}

Value Value::null()
{
    return Value{Kind::NullPtr};
}

Value Value::blockAddr(std::string function, std::string label)
{
    Value out{Kind::BlockAddr};
    out.str = std::move(function);
    out.label = std::move(label);
    return out;
}

Value Value::vtableSlot(unsigned request)
{
    Value out{Kind::VTableSlot};
    out.id = request;
    return out;
}

bool Value::isZeroBits() const
{
    switch (kind)
    {
        case Kind::ConstInt:
            return i64 == 0;
        case Kind::ConstFloat:
        {
            // -0.0 compares equal to 0.0 but has the sign bit set.
            unsigned long long bits = 0;
            std::memcpy(&bits, &f64, sizeof(bits));
            return bits == 0;
        }
        case Kind::NullPtr:
            return true;
        default:
            return false;
    }
}

bool operator==(const Value &a, const Value &b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case Value::Kind::Temp:
        case Value::Kind::VTableSlot:
            return a.id == b.id;
        case Value::Kind::ConstInt:
            return a.i64 == b.i64 && a.isBool == b.isBool;
        case Value::Kind::ConstFloat:
            return std::memcmp(&a.f64, &b.f64, sizeof(double)) == 0;
        case Value::Kind::ConstStr:
        case Value::Kind::GlobalAddr:
            return a.str == b.str;
        case Value::Kind::NullPtr:
            return true;
        case Value::Kind::BlockAddr:
            return a.str == b.str && a.label == b.label;
    }
    return false;
}

/// @brief Render a value into its textual IR representation.
/// @details Temporaries appear as `%tN`, integers print in base 10 (booleans
///          spelled out), floating-point values use enough precision to
///          round-trip, globals are prefixed with `@`, block addresses print
///          as `blockaddress(@fn, label)` and unresolved slots as `vslot#N`.
std::string toString(const Value &v)
{
    switch (v.kind)
    {
        case Value::Kind::Temp:
            return "%t" + std::to_string(v.id);
        case Value::Kind::ConstInt:
            if (v.isBool)
                return v.i64 != 0 ? "true" : "false";
            return std::to_string(v.i64);
        case Value::Kind::ConstFloat:
        {
            if (std::signbit(v.f64) && v.f64 == 0.0)
                return "-0.0";
            if (v.f64 == 0.0)
                return "0.0";
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v.f64;
            return oss.str();
        }
        case Value::Kind::ConstStr:
        {
            std::string out = "\"";
            for (char c : v.str)
            {
                if (c == '"' || c == '\\')
                    out += '\\';
                out += c;
            }
            out += '"';
            return out;
        }
        case Value::Kind::GlobalAddr:
            return "@" + v.str;
        case Value::Kind::NullPtr:
            return "null";
        case Value::Kind::BlockAddr:
            return "blockaddress(@" + v.str + ", " + v.label + ")";
        case Value::Kind::VTableSlot:
            return "vslot#" + std::to_string(v.id);
    }
    return "";
}

} // namespace kiln::core
