// File: tests/unit/lower/test_lower_pass_driver.cpp
// Purpose: Verify the lowering pass inside a pass pipeline and the driver report.
// Key invariants: After "lower-objects" the module verifies at the lowered stage.
// Ownership/Lifetime: Tests own their modules and pass managers.
// Links: docs/lowering.md

#include <gtest/gtest.h>

#include "LowerTestSupport.hpp"
#include "ir/transform/PassManager.hpp"
#include "kiln/ir/Module.hpp"
#include "kiln/lower/Lowering.hpp"
#include "lower/RuntimeNames.hpp"
#include "vm/Machine.hpp"

#include <sstream>

using namespace kiln;
using namespace kiln::test;
using core::Opcode;
using core::Type;
using core::Value;

namespace
{

/// Counter with a virtual getter, a literal array and a freeze.
void buildProgram(core::Module &m)
{
    build::IRBuilder b(m);
    ClassOptions baseOpts;
    baseOpts.isAbstract = true;
    core::ClassId base = addObjectClass(b, "Base", {}, baseOpts);
    ClassOptions opts;
    opts.parent = base;
    opts.mutability = core::Mutability::MaybeFrozen;
    opts.methods = {{"get", "Counter.get"}};
    core::ClassId counter = addObjectClass(b, "Counter", {{"n", i64()}}, opts);
    core::ClassId ints = addArrayClass(b, "Ints", {{"v", i32()}});

    auto &get = beginFunction(b, "Counter.get", i64(), {{"self", ptr()}});
    b.ret({b.objGet(i64(), param(get, 0), counter, "n")});

    beginFunction(b, "main", i64());
    Value c = b.freeze(b.objNew(counter, {ci(40)}), counter);
    Value arr = b.arrNew(ints, {ci(1), ci(1)});
    Value n = *b.vcall("get", i64(), base, {c});
    b.ret({b.add(i64(), n, b.arrSize(arr, ints))});
}

lower::LoweringOptions tracingOptions(std::ostream &os)
{
    lower::LoweringOptions opts = quietOptions();
    opts.trace = true;
    opts.traceStream = &os;
    return opts;
}

} // namespace

TEST(LowerPassDriverTest, PipelineLowersAndVerifies)
{
    core::Module m;
    buildProgram(m);

    transform::PassManager pm;
    lower::registerLowerObjectsPass(pm.passes(), quietOptions());
    pm.registerPipeline("lower", {"lower-objects"});
    pm.setVerifyBetweenPasses(true);
    auto result = pm.runPipeline(m, "lower");
    ASSERT_TRUE(result) << result.error().message;

    EXPECT_TRUE(verify::Verifier::verify(m, verify::Stage::Lowered));
    vm::Machine vm(m);
    EXPECT_EQ(vm.run("main").i64(), 42);
}

TEST(LowerPassDriverTest, UnknownPassIsReported)
{
    core::Module m;
    buildProgram(m);
    transform::PassManager pm;
    auto result = pm.run(m, {"lower-objects"});
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("unknown pass 'lower-objects'"), std::string::npos);
    EXPECT_EQ(countInModule(m, Opcode::ObjNew), 1u);
}

TEST(LowerPassDriverTest, PassKeepsItsLastReport)
{
    core::Module m;
    buildProgram(m);
    lower::LowerObjectsPass pass(quietOptions());
    pass.run(m);
    const lower::LoweringReport &report = pass.lastReport();
    EXPECT_EQ(report.functionsLowered, 2u);
    EXPECT_EQ(report.requests, 1u);
    EXPECT_EQ(report.vtables, 2u);
    EXPECT_EQ(report.slotsResolved, 1u);
    EXPECT_EQ(report.unreachableSites, 0u);
    EXPECT_TRUE(report.notes.empty());
}

TEST(LowerPassDriverTest, RuntimeHelpersAreDeclared)
{
    core::Module m;
    buildProgram(m);
    lower::lowerModule(m, quietOptions());
    ASSERT_NE(m.findExtern(lower::kRtAlloc), nullptr);
    ASSERT_NE(m.findExtern(lower::kRtTrapUnreachable), nullptr);
    EXPECT_EQ(countCalls(function(m, "main"), lower::kRtAlloc), 2u);
}

TEST(LowerPassDriverTest, TraceSummarizesTheModule)
{
    core::Module m;
    buildProgram(m);
    std::ostringstream trace;
    lower::lowerModule(m, tracingOptions(trace));
    const std::string text = trace.str();
    EXPECT_NE(text.find("[lower] @main: vcall get"), std::string::npos);
    EXPECT_NE(text.find("[lower] @main: freeze of Counter"), std::string::npos);
    EXPECT_NE(text.find("[lower] 2 functions, 1 requests, 2 vtables, 0 constants"), std::string::npos);
}

TEST(LowerPassDriverTest, PrintedModuleShowsVTables)
{
    core::Module m;
    buildProgram(m);
    transform::PassManager pm;
    lower::registerLowerObjectsPass(pm.passes(), quietOptions());
    std::ostringstream dump;
    pm.setPrintAfterEach(true);
    pm.setInstrumentationStream(dump);
    ASSERT_TRUE(pm.run(m, {"lower-objects"}));
    const std::string text = dump.str();
    EXPECT_NE(text.find("*** IR after pass 'lower-objects' ***"), std::string::npos);
    EXPECT_NE(text.find("vtable @vtable.Counter size 16"), std::string::npos);
    EXPECT_NE(text.find("!cacheable"), std::string::npos);
}

TEST(LowerPassDriverTest, SerializedModuleCarriesTheIrVersion)
{
    core::Module m;
    buildProgram(m);
    lower::lowerModule(m, quietOptions());
    const std::string text = io::Serializer::toString(m);
    EXPECT_EQ(text.rfind(std::string("kiln ") + KILN_IR_VERSION_STR, 0), 0u);
    EXPECT_STREQ(kiln::version(), KILN_VERSION_STR);
}
