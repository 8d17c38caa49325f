//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the IR type helpers: canonical spelling and storage widths used
// by the layout oracle and the memory lowering.
//
//===----------------------------------------------------------------------===//

#include "ir/core/Type.hpp"

namespace kiln::core
{

Type::Type(Kind k) : kind(k) {}

/// @brief Render an IR type enumerator to its canonical textual spelling.
/// @param k Enumeration tag to translate.
/// @return Canonical string name for the provided type tag.
std::string kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Void:
            return "void";
        case Type::Kind::I1:
            return "i1";
        case Type::Kind::I8:
            return "i8";
        case Type::Kind::I16:
            return "i16";
        case Type::Kind::I32:
            return "i32";
        case Type::Kind::I64:
            return "i64";
        case Type::Kind::F32:
            return "f32";
        case Type::Kind::F64:
            return "f64";
        case Type::Kind::Ptr:
            return "ptr";
        case Type::Kind::Label:
            return "label";
        case Type::Kind::Str:
            return "str";
        case Type::Kind::Agg:
            return "agg";
    }
    return "";
}

std::string Type::toString() const
{
    return kindToString(kind);
}

unsigned bitWidth(Type type, unsigned pointerBytes)
{
    switch (type.kind)
    {
        case Type::Kind::I1:
            return 1;
        case Type::Kind::I8:
            return 8;
        case Type::Kind::I16:
            return 16;
        case Type::Kind::I32:
        case Type::Kind::F32:
            return 32;
        case Type::Kind::I64:
        case Type::Kind::F64:
            return 64;
        case Type::Kind::Ptr:
        case Type::Kind::Label:
            return pointerBytes * 8;
        case Type::Kind::Void:
        case Type::Kind::Str:
        case Type::Kind::Agg:
            return 0;
    }
    return 0;
}

bool hasScalarRepresentation(Type type)
{
    switch (type.kind)
    {
        case Type::Kind::Void:
        case Type::Kind::Str:
        case Type::Kind::Agg:
            return false;
        default:
            return true;
    }
}

bool isInteger(Type type)
{
    switch (type.kind)
    {
        case Type::Kind::I1:
        case Type::Kind::I8:
        case Type::Kind::I16:
        case Type::Kind::I32:
        case Type::Kind::I64:
            return true;
        default:
            return false;
    }
}

} // namespace kiln::core
