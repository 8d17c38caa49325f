// File: tests/unit/lower/test_lower_arrays.cpp
// Purpose: Verify array construction, cloning, element access and header queries.
// Key invariants: Header is [count:i32][reserved:i32][vtable] before the element region;
//                 no construction path leaves garbage in the allocation.
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

namespace
{

struct ArrayModule
{
    core::Module m;
    build::IRBuilder b{m};
    core::ClassId bytes = addArrayClass(b, "Bytes", {{"v", i8()}});
    core::ClassId ints = addArrayClass(b, "Ints", {{"v", i32()}});
    core::ClassId words = addArrayClass(b, "Words", {{"v", i64()}});
    core::ClassId pairs = addArrayClass(b, "Pairs", {{"key", i32()}, {"tag", i8()}});
};

std::vector<core::Instr> storesIn(const core::Function &fn)
{
    std::vector<core::Instr> out;
    for (const auto &bb : fn.blocks)
        for (const auto &in : bb.instructions)
            if (in.op == Opcode::Store)
                out.push_back(in);
    return out;
}

} // namespace

TEST(LowerArraysTest, LengthMatchesLiteralCount)
{
    ArrayModule am;
    auto &b = am.b;
    beginFunction(b, "empty", i64());
    b.ret({b.arrSize(b.arrNew(am.ints, {}), am.ints)});
    beginFunction(b, "three", i64());
    b.ret({b.arrSize(b.arrNew(am.ints, {ci(1), ci(0), ci(3)}), am.ints)});

    lower::lowerModule(am.m, quietOptions());
    vm::Machine vm(am.m);
    EXPECT_EQ(vm.run("empty").i64(), 0);
    EXPECT_EQ(vm.run("three").i64(), 3);
}

TEST(LowerArraysTest, LengthMatchesDynamicCount)
{
    ArrayModule am;
    auto &b = am.b;
    auto &fn = beginFunction(b, "make", i64(), {{"n", i64()}});
    b.ret({b.arrSize(b.arrAlloc(am.words, param(fn, 0)), am.words)});

    lower::lowerModule(am.m, quietOptions());
    vm::Machine vm(am.m);
    for (int64_t n : {0, 1, 5, 17})
        EXPECT_EQ(vm.run("make", {vm::Slot::fromInt(n)}).i64(), n);
}

TEST(LowerArraysTest, LiteralSkipsZeroStoresIntoZeroedMemory)
{
    ArrayModule am;
    auto &b = am.b;
    beginFunction(b, "main", ptr());
    b.ret({b.arrNew(am.ints, {ci(1), ci(0), ci(3)})});

    lower::lowerModule(am.m, quietOptions());
    const core::Function &fn = function(am.m, "main");
    const core::Instr &alloc = fn.blocks.front().instructions.front();
    ASSERT_EQ(alloc.callee, "kiln_alloc");
    EXPECT_EQ(alloc.operands[0], ci(16 + 16));
    EXPECT_EQ(alloc.operands[1], Value::constBool(true));
    // count, vtable, and the two non-zero elements
    EXPECT_EQ(storesIn(fn).size(), 4u);

    vm::Machine vm(am.m);
    const uint64_t arr = vm.run("main").bits;
    EXPECT_EQ(vm.readWord(arr - 16, 4), 3u);
    EXPECT_EQ(vm.readWord(arr - 12, 4), 0u);
    EXPECT_EQ(vm.readWord(arr - 8, 8), vm.vtableAddress("vtable.Ints"));
    const std::vector<uint8_t> expected = {1, 0, 0, 0, 0, 0, 0, 0, 3, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(vm.readBytes(arr, 16), expected);
}

TEST(LowerArraysTest, DynamicAllocationIsZeroFilledAndPadded)
{
    ArrayModule am;
    auto &b = am.b;
    auto &fn = beginFunction(b, "make", ptr(), {{"n", i64()}});
    b.ret({b.arrAlloc(am.bytes, param(fn, 0))});

    lower::lowerModule(am.m, quietOptions());
    vm::Machine vm(am.m);
    const uint64_t arr = vm.run("make", {vm::Slot::fromInt(5)}).bits;
    ASSERT_EQ(vm.allocations().size(), 1u);
    EXPECT_EQ(vm.allocations()[0].bytes, 16u + 8u);
    EXPECT_TRUE(allZero(vm.readBytes(arr, 8)));
    EXPECT_EQ(vm.readWord(arr - 16, 4), 5u);
}

TEST(LowerArraysTest, CloneDoesNotAliasItsSource)
{
    ArrayModule am;
    auto &b = am.b;
    beginFunction(b, "main", ty(Type::Kind::Agg));
    Value src = b.arrNew(am.words, {ci(10), ci(20), ci(30)});
    Value dst = b.arrClone(am.words, src);
    b.arrSet(dst, am.words, ci(1), ci(99));
    b.ret({b.arrGet(i64(), src, am.words, ci(1)),
           b.arrGet(i64(), dst, am.words, ci(1)),
           b.arrSize(dst, am.words)});

    lower::lowerModule(am.m, quietOptions());
    vm::Machine vm(am.m);
    vm::Slot r = vm.run("main");
    ASSERT_EQ(r.agg.size(), 3u);
    EXPECT_EQ(r.agg[0].i64(), 20);
    EXPECT_EQ(r.agg[1].i64(), 99);
    EXPECT_EQ(r.agg[2].i64(), 3);
}

TEST(LowerArraysTest, CloneOfUnknownLengthZeroesItsTail)
{
    ArrayModule am;
    auto &b = am.b;
    auto &dup = beginFunction(b, "dup", ptr(), {{"a", ptr()}});
    b.ret({b.arrClone(am.bytes, param(dup, 0))});
    beginFunction(b, "main", ptr());
    Value src = b.arrNew(am.bytes, {ci(1), ci(2), ci(3), ci(4), ci(5)});
    b.ret({*b.call("dup", ptr(), {src})});

    lower::lowerModule(am.m, quietOptions());
    const core::Function &lowered = function(am.m, "dup");
    const core::Instr &alloc = *std::find_if(lowered.blocks.front().instructions.begin(),
                                             lowered.blocks.front().instructions.end(),
                                             [](const core::Instr &in) { return in.op == Opcode::Call; });
    EXPECT_EQ(alloc.operands[1], Value::constBool(false));

    vm::Machine vm(am.m);
    const uint64_t copy = vm.run("main").bits;
    ASSERT_EQ(vm.allocations().size(), 2u);
    EXPECT_EQ(vm.allocations()[1].bytes, 16u + 8u);
    const std::vector<uint8_t> expected = {1, 2, 3, 4, 5, 0, 0, 0};
    EXPECT_EQ(vm.readBytes(copy, 8), expected);
    EXPECT_EQ(vm.readWord(copy - 16, 4), 5u);
    EXPECT_EQ(vm.readWord(copy - 12, 4), 0u);
    EXPECT_EQ(vm.readWord(copy - 8, 8), vm.vtableAddress("vtable.Bytes"));
}

TEST(LowerArraysTest, CloneOfEmptyArrayKeepsItsHeader)
{
    ArrayModule am;
    auto &b = am.b;
    auto &dup = beginFunction(b, "dup", ptr(), {{"a", ptr()}});
    b.ret({b.arrClone(am.bytes, param(dup, 0))});
    beginFunction(b, "main", i64());
    Value copy = *b.call("dup", ptr(), {b.arrNew(am.bytes, {})});
    b.ret({b.arrSize(copy, am.bytes)});

    lower::lowerModule(am.m, quietOptions());
    vm::Machine vm(am.m);
    EXPECT_EQ(vm.run("main").i64(), 0);
    const uint64_t copyAddr = vm.allocations()[1].address + 16;
    EXPECT_EQ(vm.readWord(copyAddr - 8, 8), vm.vtableAddress("vtable.Bytes"));
    EXPECT_EQ(vm.readWord(copyAddr - 12, 4), 0u);
}

TEST(LowerArraysTest, CloneOfKnownLengthUsesAlignedTailStores)
{
    ArrayModule am;
    auto &b = am.b;
    beginFunction(b, "main", ptr());
    Value src = b.arrNew(am.bytes, {ci(1), ci(2), ci(3), ci(4), ci(5)});
    b.ret({b.arrClone(am.bytes, src)});

    lower::lowerModule(am.m, quietOptions());
    const core::Function &fn = function(am.m, "main");
    bool sawByte = false;
    bool sawHalf = false;
    for (const auto &st : storesIn(fn))
    {
        if (st.type.kind == Type::Kind::I8 && st.operands[1] == ci(5))
            sawByte = true;
        if (st.type.kind == Type::Kind::I16 && st.operands[1] == ci(6))
            sawHalf = true;
    }
    EXPECT_TRUE(sawByte);
    EXPECT_TRUE(sawHalf);
    EXPECT_EQ(util::countOpcode(fn, Opcode::Load), 0u);

    vm::Machine vm(am.m);
    const uint64_t copy = vm.run("main").bits;
    const std::vector<uint8_t> expected = {1, 2, 3, 4, 5, 0, 0, 0};
    EXPECT_EQ(vm.readBytes(copy, 8), expected);
}

TEST(LowerArraysTest, HashIsACacheableWidenedLoad)
{
    ArrayModule am;
    auto &b = am.b;
    beginFunction(b, "main", i64());
    b.ret({b.arrHash(b.arrNew(am.ints, {ci(4)}), am.ints)});

    lower::lowerModule(am.m, quietOptions());
    const core::Function &fn = function(am.m, "main");
    bool sawLoad = false;
    for (const auto &in : fn.blocks.front().instructions)
    {
        if (in.op != Opcode::Load)
            continue;
        sawLoad = true;
        EXPECT_EQ(in.type.kind, Type::Kind::I32);
        EXPECT_TRUE(in.MemAttr.cacheable);
        EXPECT_EQ(in.operands[1], ci(-12));
    }
    EXPECT_TRUE(sawLoad);
    EXPECT_EQ(util::countOpcode(fn, Opcode::Zext), 1u);

    vm::Machine vm(am.m);
    EXPECT_EQ(vm.run("main").i64(), 0);
}

TEST(LowerArraysTest, TupleSlotsAndDynamicIndices)
{
    ArrayModule am;
    auto &b = am.b;
    auto &at = beginFunction(b, "tagAt", i8(), {{"a", ptr()}, {"i", i64()}});
    b.ret({b.arrGet(i8(), param(at, 0), am.pairs, param(at, 1), "tag")});

    beginFunction(b, "main", ty(Type::Kind::Agg));
    Value arr = b.arrNew(am.pairs, {ci(1), ci(2), ci(3), ci(4)});
    b.arrSet(arr, am.pairs, ci(0), ci(9), "key");
    Value key = b.arrGet(i32(), arr, am.pairs, ci(0), "key");
    Value tag = *b.call("tagAt", i8(), {arr, ci(1)});
    b.ret({key, tag, arr});

    lower::lowerModule(am.m, quietOptions());
    vm::Machine vm(am.m);
    vm::Slot r = vm.run("main");
    ASSERT_EQ(r.agg.size(), 3u);
    EXPECT_EQ(r.agg[0].i64(), 9);
    EXPECT_EQ(r.agg[1].i64(), 4);
    // Padding after each tag stays zero.
    const std::vector<uint8_t> expected = {9, 0, 0, 0, 2, 0, 0, 0, 3, 0, 0, 0, 4, 0, 0, 0};
    EXPECT_EQ(vm.readBytes(r.agg[2].bits, 16), expected);
}

TEST(LowerArraysTest, ArrayOperationOnObjectClassIsFatal)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId point = addObjectClass(b, "Point", {{"x", i64()}});
    auto &fn = beginFunction(b, "len", i64(), {{"p", ptr()}});
    b.ret({b.arrGet(i64(), param(fn, 0), point, ci(0))});
    EXPECT_THROW(lower::lowerModule(m, quietOptions()), support::InternalError);
}
