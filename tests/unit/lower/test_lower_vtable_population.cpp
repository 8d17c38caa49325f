// File: tests/unit/lower/test_lower_vtable_population.cpp
// Purpose: Verify greedy vtable slot assignment and plan application.
// Key invariants: A request has one offset in every participating vtable and
//                 no two requests overlap within a vtable.
// Ownership/Lifetime: Tests own their modules and registries.
// Links: docs/lowering.md

#include <gtest/gtest.h>

#include "LowerTestSupport.hpp"
#include "lower/VTablePopulation.hpp"
#include "lower/VTableRegistry.hpp"

using namespace kiln;
using namespace kiln::test;
using core::Type;
using core::Value;

namespace
{

struct ThreeClasses
{
    core::Module m;
    build::IRBuilder b{m};
    core::ClassId a = addObjectClass(b, "A", {});
    core::ClassId bb = addObjectClass(b, "B", {});
    core::ClassId c = addObjectClass(b, "C", {});
};

std::vector<lower::VTableEntry> fnEntries(const std::vector<core::ClassId> &classes, const std::string &tag)
{
    std::vector<lower::VTableEntry> out;
    for (core::ClassId cls : classes)
        out.push_back({cls, Value::global(tag + std::to_string(cls))});
    return out;
}

} // namespace

TEST(VTablePopulationTest, LargestRequestsArePlacedFirst)
{
    ThreeClasses t;
    lower::VTableRegistry reg;
    reg.submit(fnEntries({t.a, t.bb, t.c}, "f"), ptr(), "f", {});
    reg.submit(fnEntries({t.a, t.bb}, "g"), ptr(), "g", {});
    reg.submit(fnEntries({t.c}, "h"), ptr(), "h", {});
    reg.submit(fnEntries({t.bb, t.c}, "k"), ptr(), "k", {});

    lower::GreedyVTablePopulator populator;
    lower::VTablePlan plan = populator.plan(t.m, reg, 8);
    EXPECT_EQ(plan.requestOffsets, (std::vector<uint32_t>{8, 16, 16, 24}));

    ASSERT_EQ(plan.tables.size(), 3u);
    EXPECT_EQ(plan.tables[0].symbol, "vtable.A");
    EXPECT_EQ(plan.tables[0].sizeBytes, 24u);
    EXPECT_EQ(plan.tables[1].sizeBytes, 32u);
    EXPECT_EQ(plan.tables[2].sizeBytes, 32u);
}

TEST(VTablePopulationTest, EveryTableStartsWithItsClassId)
{
    ThreeClasses t;
    lower::VTableRegistry reg;
    reg.requireVTable(t.c);
    reg.requireVTable(t.a);

    lower::VTablePlan plan = lower::GreedyVTablePopulator().plan(t.m, reg, 8);
    ASSERT_EQ(plan.tables.size(), 2u);
    for (const auto &table : plan.tables)
    {
        ASSERT_EQ(table.slots.size(), 1u);
        EXPECT_EQ(table.slots[0].offset, 0u);
        EXPECT_EQ(table.slots[0].type, Type(Type::Kind::I64));
        EXPECT_EQ(table.slots[0].value, ci(table.classId));
        EXPECT_EQ(table.sizeBytes, 8u);
    }
    EXPECT_EQ(plan.tables[0].classId, t.a);
    EXPECT_EQ(plan.tables[1].classId, t.c);
}

TEST(VTablePopulationTest, NarrowValuesSharePacking)
{
    ThreeClasses t;
    lower::VTableRegistry reg;
    reg.submit({{t.a, Value::constBool(true)}, {t.bb, Value::constBool(false)}}, i1(), "flag", {});
    reg.submit({{t.a, ci(3)}, {t.bb, ci(4)}}, i8(), "idx", {});
    reg.submit({{t.a, ci(5)}, {t.bb, ci(6)}}, i32(), "wide", {});

    lower::VTablePlan plan = lower::GreedyVTablePopulator().plan(t.m, reg, 8);
    EXPECT_EQ(plan.requestOffsets, (std::vector<uint32_t>{8, 9, 12}));
    EXPECT_EQ(plan.tables[0].sizeBytes, 16u);
}

TEST(VTablePopulationTest, ValueBytesFollowTheType)
{
    EXPECT_EQ(lower::vtableValueBytes(i1(), 8), 1u);
    EXPECT_EQ(lower::vtableValueBytes(i8(), 8), 1u);
    EXPECT_EQ(lower::vtableValueBytes(i32(), 8), 4u);
    EXPECT_EQ(lower::vtableValueBytes(ptr(), 8), 8u);
    EXPECT_EQ(lower::vtableValueBytes(ptr(), 4), 4u);
}

TEST(VTablePopulationTest, ApplyingThePlanResolvesSlotOperands)
{
    ThreeClasses t;
    lower::VTableRegistry reg;
    reg.submit(fnEntries({t.a, t.bb, t.c}, "f"), ptr(), "f", {});
    reg.submit(fnEntries({t.a, t.bb}, "g"), ptr(), "g", {});

    auto &fn = beginFunction(t.b, "main", ptr(), {{"vt", ptr()}});
    Value loaded = t.b.load(ptr(), param(fn, 0), Value::vtableSlot(1));
    t.b.ret({loaded});

    lower::VTablePlan plan = lower::GreedyVTablePopulator().plan(t.m, reg, 8);
    EXPECT_EQ(lower::applyVTablePlan(t.m, plan), 1u);
    EXPECT_EQ(t.m.vtables.size(), 3u);
    const core::Instr &load = function(t.m, "main").blocks.front().instructions.front();
    EXPECT_EQ(load.operands[1], ci(16));
}
