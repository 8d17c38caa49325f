// File: tests/unit/lower/test_lower_objects.cpp
// Purpose: Verify object construction and field access lowering end to end.
// Key invariants: Every bit of a fresh object that no field covers is zero.
// Ownership/Lifetime: Tests own their modules and machines.
// Links: docs/lowering.md

#include <gtest/gtest.h>

#include "LowerTestSupport.hpp"
#include "support/internal_error.hpp"
#include "vm/Machine.hpp"

using namespace kiln;
using namespace kiln::test;
using core::Opcode;
using core::Type;
using core::Value;

TEST(LowerObjectsTest, FieldsReadBackTheLastStoredValue)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId point =
        addObjectClass(b, "Point", {{"x", i64()}, {"y", i32()}, {"flag", i1()}, {"ratio", f64()}});

    beginFunction(b, "main", ty(Type::Kind::Agg));
    Value p = b.objNew(point, {ci(-5), ci(7), Value::constBool(true), Value::constFloat(2.5)});
    b.objSet(p, point, "y", ci(42));
    b.objSet(p, point, "flag", Value::constBool(false));
    b.objSet(p, point, "flag", Value::constBool(true));
    Value x = b.objGet(i64(), p, point, "x");
    Value y = b.objGet(i32(), p, point, "y");
    Value flag = b.objGet(i1(), p, point, "flag");
    Value ratio = b.objGet(f64(), p, point, "ratio");
    b.ret({x, y, flag, ratio});

    lower::lowerModule(m, quietOptions());
    EXPECT_EQ(countInModule(m, Opcode::ObjNew), 0u);
    EXPECT_EQ(countInModule(m, Opcode::ObjGet), 0u);
    EXPECT_EQ(countInModule(m, Opcode::ObjSet), 0u);

    vm::Machine vm(m);
    vm::Slot r = vm.run("main");
    ASSERT_EQ(r.agg.size(), 4u);
    EXPECT_EQ(r.agg[0].i64(), -5);
    EXPECT_EQ(r.agg[1].bits, 42u);
    EXPECT_EQ(r.agg[2].bits, 1u);
    EXPECT_DOUBLE_EQ(r.agg[3].f64, 2.5);
}

TEST(LowerObjectsTest, AllocatesWithoutZeroFillAndStoresVTableFirst)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId pair = addObjectClass(b, "Pair", {{"a", i64()}, {"b", i8()}});

    beginFunction(b, "main", ptr());
    b.ret({b.objNew(pair, {ci(1), ci(2)})});

    lower::lowerModule(m, quietOptions());
    const core::BasicBlock &entry = function(m, "main").blocks.front();
    ASSERT_GE(entry.instructions.size(), 3u);

    const core::Instr &alloc = entry.instructions[0];
    EXPECT_EQ(alloc.op, Opcode::Call);
    EXPECT_EQ(alloc.callee, "kiln_alloc");
    EXPECT_EQ(alloc.operands[0], ci(8 + 16));
    EXPECT_EQ(alloc.operands[1], Value::constBool(false));

    const core::Instr &vtableStore = entry.instructions[1];
    EXPECT_EQ(vtableStore.op, Opcode::Store);
    EXPECT_EQ(vtableStore.operands[1], ci(0));
    EXPECT_EQ(vtableStore.operands[2], Value::global("vtable.Pair"));

    ASSERT_EQ(m.vtables.size(), 1u);
    EXPECT_EQ(m.vtables[0].symbol, "vtable.Pair");
}

TEST(LowerObjectsTest, SparseLayoutLeavesNoUndefinedBit)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId sparse =
        addObjectClass(b, "Sparse", {{"a", i8()}, {"flag", i1()}, {"b", i32()}, {"c", i64()}});

    lower::NaturalLayoutOracle layout(8);
    layout.setLayout(sparse, {{"a", 0, i8()}, {"flag", 13, i1()}, {"b", 96, i32()}, {"c", 192, i64()}});

    beginFunction(b, "main", ptr());
    b.ret({b.objNew(sparse, {ci(0x7F), Value::constBool(true), ci(-1), ci(0x1122334455667788LL)})});

    lower::LoweringOracles oracles;
    oracles.layout = &layout;
    lower::lowerModule(m, quietOptions(), oracles);

    vm::Machine vm(m);
    const uint64_t obj = vm.run("main").bits;
    ASSERT_EQ(vm.allocations().size(), 1u);
    const auto &alloc = vm.allocations()[0];
    EXPECT_EQ(alloc.bytes, 40u);
    EXPECT_EQ(obj, alloc.address + 8);
    EXPECT_EQ(vm.readWord(alloc.address, 8), vm.vtableAddress("vtable.Sparse"));

    const std::vector<uint8_t> expected = {
        0x7F, 0x20, 0, 0, 0, 0, 0, 0,                   // a, flag at bit 13
        0, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0xFF,             // b in the upper half
        0, 0, 0, 0, 0, 0, 0, 0,                         // untouched word
        0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11, // c
    };
    EXPECT_EQ(vm.readBytes(obj, 32), expected);
}

TEST(LowerObjectsTest, GapWordsAreZeroedBeforeFieldStores)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId cls = addObjectClass(b, "Holey", {{"lo", i32()}, {"hi", i64()}});

    beginFunction(b, "main", ptr());
    b.ret({b.objNew(cls, {ci(3), ci(4)})});
    lower::lowerModule(m, quietOptions());

    // alloc, vtable store, gep, one gap store, two field stores, ret
    const auto &ins = function(m, "main").blocks.front().instructions;
    ASSERT_EQ(ins.size(), 7u);
    EXPECT_EQ(ins[3].op, Opcode::Store);
    EXPECT_EQ(ins[3].type.kind, Type::Kind::I64);
    EXPECT_EQ(ins[3].operands[1], ci(0));
    EXPECT_EQ(ins[3].operands[2], ci(0));
    EXPECT_EQ(ins[4].type.kind, Type::Kind::I32);
}

TEST(LowerObjectsTest, LayoutFieldCountMismatchIsFatal)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId cls = addObjectClass(b, "Stale", {{"a", i64()}, {"b", i64()}});
    lower::NaturalLayoutOracle layout(8);
    layout.setLayout(cls, {{"a", 0, i64()}});

    beginFunction(b, "main", ptr());
    b.ret({b.objNew(cls, {ci(1), ci(2)})});

    lower::LoweringOracles oracles;
    oracles.layout = &layout;
    EXPECT_THROW(lower::lowerModule(m, quietOptions(), oracles), support::InternalError);
}

TEST(LowerObjectsTest, MisalignedWideFieldIsFatal)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId cls = addObjectClass(b, "Skewed", {{"a", i32()}});
    lower::NaturalLayoutOracle layout(8);
    layout.setLayout(cls, {{"a", 4, i32()}});

    beginFunction(b, "main", ptr());
    b.ret({b.objNew(cls, {ci(1)})});

    lower::LoweringOracles oracles;
    oracles.layout = &layout;
    EXPECT_THROW(lower::lowerModule(m, quietOptions(), oracles), support::InternalError);
}

TEST(LowerObjectsTest, ValueClassConstructionIsFatal)
{
    core::Module m;
    build::IRBuilder b(m);
    ClassOptions opts;
    opts.kind = core::ClassKind::Value;
    core::ClassId cls = addObjectClass(b, "Complex", {{"re", f64()}, {"im", f64()}}, opts);

    beginFunction(b, "main", ptr());
    b.ret({b.objNew(cls, {Value::constFloat(1.0), Value::constFloat(0.0)})});
    EXPECT_THROW(lower::lowerModule(m, quietOptions()), support::InternalError);
}

TEST(LowerObjectsTest, UnstorableFieldIsFatalAtTheAllocation)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId cls = addObjectClass(b, "Holder", {{"text", ty(Type::Kind::Str)}});

    beginFunction(b, "main", ptr());
    b.setLoc({1, 3, 9});
    b.ret({b.objNew(cls, {Value::constStr("hi")})});

    try
    {
        lower::lowerModule(m, quietOptions());
        FAIL() << "expected an internal error";
    }
    catch (const support::InternalError &e)
    {
        EXPECT_EQ(e.diagnostic().loc.line, 3u);
        EXPECT_NE(std::string(e.what()).find("unstorable type str"), std::string::npos);
    }
}
