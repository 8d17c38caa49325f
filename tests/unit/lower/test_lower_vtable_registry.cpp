// File: tests/unit/lower/test_lower_vtable_registry.cpp
// Purpose: Verify canonicalization and contract checks of vtable requests.
// Key invariants: Structurally equal requests share one id regardless of entry order.
// Ownership/Lifetime: Each test owns its registry.
// Links: docs/lowering.md

#include <gtest/gtest.h>

#include "lower/VTableRegistry.hpp"
#include "support/internal_error.hpp"

using namespace kiln;
using namespace kiln::lower;
using core::Type;
using core::Value;

namespace
{

Type ptrTy()
{
    return Type(Type::Kind::Ptr);
}

} // namespace

TEST(VTableRegistryTest, PermutedEntriesShareOneRequest)
{
    VTableRegistry reg;
    unsigned a = reg.submit({{1, Value::global("Circle.area")}, {2, Value::global("Square.area")}},
                            ptrTy(),
                            "area",
                            {});
    unsigned b = reg.submit({{2, Value::global("Square.area")}, {1, Value::global("Circle.area")}},
                            ptrTy(),
                            "area.again",
                            {});
    EXPECT_EQ(a, b);
    ASSERT_EQ(reg.requests().size(), 1u);
    EXPECT_EQ(reg.request(a).name, "area");
    ASSERT_EQ(reg.request(a).entries.size(), 2u);
    EXPECT_EQ(reg.request(a).entries[0].cls, 1u);
    EXPECT_EQ(reg.request(a).entries[1].cls, 2u);
}

TEST(VTableRegistryTest, DifferentTypeOrValuesMakeNewRequests)
{
    VTableRegistry reg;
    unsigned a = reg.submit({{1, Value::constInt(0)}, {2, Value::constInt(1)}}, Type(Type::Kind::I8), "idx", {});
    unsigned b = reg.submit({{1, Value::constInt(0)}, {2, Value::constInt(1)}}, Type(Type::Kind::I32), "idx", {});
    unsigned c = reg.submit({{1, Value::constInt(1)}, {2, Value::constInt(0)}}, Type(Type::Kind::I8), "idx", {});
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(b, c);
    EXPECT_EQ(reg.requests().size(), 3u);
}

TEST(VTableRegistryTest, RepeatedIdenticalEntryIsCollapsed)
{
    VTableRegistry reg;
    unsigned id = reg.submit({{3, Value::constBool(true)}, {3, Value::constBool(true)}, {1, Value::constBool(false)}},
                             Type(Type::Kind::I1),
                             "flag",
                             {});
    EXPECT_EQ(reg.request(id).entries.size(), 2u);
}

TEST(VTableRegistryTest, ContradictoryEntriesAreFatal)
{
    VTableRegistry reg;
    EXPECT_THROW(reg.submit({{1, Value::global("A.f")}, {1, Value::global("B.f")}}, ptrTy(), "f", {}),
                 support::InternalError);
}

TEST(VTableRegistryTest, EmptyRequestIsFatal)
{
    VTableRegistry reg;
    EXPECT_THROW(reg.submit({}, ptrTy(), "nothing", {}), support::InternalError);
}

TEST(VTableRegistryTest, NonConstantOrUnstorableValuesAreFatal)
{
    VTableRegistry reg;
    EXPECT_THROW(reg.submit({{1, Value::temp(4)}}, Type(Type::Kind::I64), "temp", {}), support::InternalError);
    EXPECT_THROW(reg.submit({{1, Value::constStr("x")}}, Type(Type::Kind::Str), "str", {}),
                 support::InternalError);
}

TEST(VTableRegistryTest, TracksClassesNeedingVTables)
{
    VTableRegistry reg;
    reg.submit({{4, Value::constInt(1)}, {2, Value::constInt(2)}}, Type(Type::Kind::I64), "size", {});
    reg.requireVTable(7);
    EXPECT_EQ(reg.classesNeedingVTables(), (std::set<core::ClassId>{2, 4, 7}));
}
