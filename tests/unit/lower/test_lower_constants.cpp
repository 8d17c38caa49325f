// File: tests/unit/lower/test_lower_constants.cpp
// Purpose: Verify that constant objects reachable from globals get vtables.
// Key invariants: Every constant is visited at most once, including on cycles.
// Ownership/Lifetime: Tests own their modules and registries.
// Links: docs/lowering.md

#include <gtest/gtest.h>

#include "LowerTestSupport.hpp"
#include "lower/ConstantScavenger.hpp"
#include "lower/VTableRegistry.hpp"
#include "support/internal_error.hpp"

using namespace kiln;
using namespace kiln::test;

namespace
{

core::ConstField refTo(unsigned id)
{
    core::ConstField f;
    f.ref = id;
    return f;
}

core::ConstField scalar(long long v)
{
    core::ConstField f;
    f.value = core::Value::constInt(v);
    return f;
}

/// Root -> {a, b}; a <-> b form a cycle; Spare is never referenced.
struct ConstantGraph
{
    core::Module m;
    build::IRBuilder b{m};
    core::ClassId root = addObjectClass(b, "Root", {{"left", ptr()}, {"right", ptr()}});
    core::ClassId node = addObjectClass(b, "Node", {{"next", ptr()}, {"v", i64()}});
    core::ClassId spare = addObjectClass(b, "Spare", {{"v", i64()}});

    ConstantGraph()
    {
        unsigned r = b.addConstant(root, {refTo(1), refTo(2)});
        b.addConstant(node, {refTo(2), scalar(1)});
        b.addConstant(node, {refTo(1), scalar(2)});
        b.addConstant(spare, {scalar(3)});
        b.addGlobal("table", ptr()).constRoot = r;
    }
};

} // namespace

TEST(ConstantScavengerTest, VisitsSharedAndCyclicConstantsOnce)
{
    ConstantGraph g;
    lower::VTableRegistry reg;
    EXPECT_EQ(lower::scavengeConstants(g.m, reg), 3u);
    const auto &classes = reg.classesNeedingVTables();
    EXPECT_EQ(classes.size(), 2u);
    EXPECT_EQ(classes.count(g.root), 1u);
    EXPECT_EQ(classes.count(g.node), 1u);
    EXPECT_EQ(classes.count(g.spare), 0u);
}

TEST(ConstantScavengerTest, GlobalsWithoutConstantsContributeNothing)
{
    core::Module m;
    build::IRBuilder b(m);
    b.addGlobalStr("greeting", "hello");
    lower::VTableRegistry reg;
    EXPECT_EQ(lower::scavengeConstants(m, reg), 0u);
    EXPECT_TRUE(reg.classesNeedingVTables().empty());
}

TEST(ConstantScavengerTest, LoweringEmitsVTablesForReachableConstants)
{
    ConstantGraph g;
    lower::LoweringReport report = lower::lowerModule(g.m, quietOptions());
    EXPECT_EQ(report.constantsVisited, 3u);
    ASSERT_EQ(g.m.vtables.size(), 2u);
    EXPECT_EQ(g.m.vtables[0].symbol, "vtable.Root");
    EXPECT_EQ(g.m.vtables[1].symbol, "vtable.Node");
}

TEST(ConstantScavengerTest, DanglingReferenceIsFatal)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId node = addObjectClass(b, "Node", {{"next", ptr()}});
    unsigned first = b.addConstant(node, {refTo(7)});
    b.addGlobal("head", ptr()).constRoot = first;
    lower::VTableRegistry reg;
    EXPECT_THROW(lower::scavengeConstants(m, reg), support::InternalError);
}
