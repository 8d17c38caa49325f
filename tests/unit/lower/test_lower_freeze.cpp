// File: tests/unit/lower/test_lower_freeze.cpp
// Purpose: Verify freeze lowering for each mutability state.
// Key invariants: Freezing sets the low bit of the vtable word; an instance that
//                 may live in read-only storage is only written when not yet frozen.
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

struct FreezeRun
{
    uint64_t object = 0;
    size_t vtableWordStores = 0;
    uint64_t vtableWord = 0;
};

/// Build a Box of @p state, freeze it twice and run the result.
FreezeRun freezeTwice(core::Mutability state, core::Module *out = nullptr)
{
    core::Module m;
    build::IRBuilder b(m);
    ClassOptions opts;
    opts.mutability = state;
    core::ClassId box = addObjectClass(b, "Box", {{"v", i64()}}, opts);

    beginFunction(b, "main", ptr());
    Value obj = b.objNew(box, {ci(1)});
    Value once = b.freeze(obj, box);
    Value twice = b.freeze(once, box);
    b.ret({twice});

    lower::lowerModule(m, quietOptions());

    std::vector<uint64_t> stores;
    vm::Machine vm(m);
    vm.setStoreHook([&](uint64_t address, unsigned) { stores.push_back(address); });
    FreezeRun run;
    run.object = vm.run("main").bits;
    run.vtableWordStores =
        static_cast<size_t>(std::count(stores.begin(), stores.end(), run.object - 8));
    run.vtableWord = vm.readWord(run.object - 8, 8);
    if (out)
        *out = std::move(m);
    return run;
}

} // namespace

TEST(LowerFreezeTest, MaybeFrozenWritesTheFlagOnce)
{
    core::Module lowered;
    FreezeRun run = freezeTwice(core::Mutability::MaybeFrozen, &lowered);
    // Construction plus the first freeze.
    EXPECT_EQ(run.vtableWordStores, 2u);
    EXPECT_EQ(run.vtableWord & 1u, 1u);

    const core::Function &fn = function(lowered, "main");
    EXPECT_EQ(util::countOpcode(fn, Opcode::CBr), 2u);
    EXPECT_NE(util::findBlock(fn, "entry.freeze.0"), nullptr);
    EXPECT_NE(util::findBlock(fn, "entry.frozen.0"), nullptr);
    EXPECT_EQ(util::countOpcode(fn, Opcode::Freeze), 0u);
}

TEST(LowerFreezeTest, MutableWritesTheFlagUnconditionally)
{
    core::Module lowered;
    FreezeRun run = freezeTwice(core::Mutability::Mutable, &lowered);
    EXPECT_EQ(run.vtableWordStores, 3u);
    EXPECT_EQ(run.vtableWord & 1u, 1u);
    EXPECT_EQ(function(lowered, "main").blocks.size(), 1u);
}

TEST(LowerFreezeTest, DeepImmutableEmitsNothing)
{
    core::Module lowered;
    FreezeRun run = freezeTwice(core::Mutability::DeepImmutable, &lowered);
    EXPECT_EQ(run.vtableWordStores, 1u);
    EXPECT_EQ(run.vtableWord & 1u, 0u);
    EXPECT_EQ(countInModule(lowered, Opcode::Load), 0u);
}

TEST(LowerFreezeTest, DispatchIgnoresTheFrozenFlag)
{
    core::Module m;
    build::IRBuilder b(m);
    ClassOptions baseOpts;
    baseOpts.isAbstract = true;
    baseOpts.mutability = core::Mutability::MaybeFrozen;
    core::ClassId base = addObjectClass(b, "Cell", {}, baseOpts);
    ClassOptions opts;
    opts.parent = base;
    opts.mutability = core::Mutability::MaybeFrozen;
    opts.methods = {{"get", "Counter.get"}};
    core::ClassId counter = addObjectClass(b, "Counter", {{"n", i64()}}, opts);

    auto &get = beginFunction(b, "Counter.get", i64(), {{"self", ptr()}});
    b.ret({b.objGet(i64(), param(get, 0), counter, "n")});

    beginFunction(b, "main", i64());
    Value c = b.freeze(b.objNew(counter, {ci(11)}), base);
    b.ret({*b.vcall("get", i64(), base, {c})});

    lower::lowerModule(m, quietOptions());
    vm::Machine vm(m);
    EXPECT_EQ(vm.run("main").i64(), 11);
}

TEST(LowerFreezeTest, ValueClassIsFatal)
{
    core::Module m;
    build::IRBuilder b(m);
    ClassOptions opts;
    opts.kind = core::ClassKind::Value;
    core::ClassId money = addObjectClass(b, "Money", {{"cents", i64()}}, opts);
    auto &fn = beginFunction(b, "main", ptr(), {{"p", ptr()}});
    b.ret({b.freeze(param(fn, 0), money)});
    EXPECT_THROW(lower::lowerModule(m, quietOptions()), support::InternalError);
}
