//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Module-level driver for object-model lowering.
//
//===----------------------------------------------------------------------===//

#include "lower/LowerObjects.hpp"

#include "ir/build/IRBuilder.hpp"
#include "ir/core/Module.hpp"
#include "ir/verify/Verifier.hpp"
#include "lower/ConstantScavenger.hpp"
#include "lower/FunctionLowerer.hpp"
#include "lower/LoweringContext.hpp"
#include "lower/RuntimeNames.hpp"
#include "support/internal_error.hpp"

#include <memory>
#include <optional>

namespace kiln::lower
{

using namespace kiln::core;

namespace
{

void declareRuntime(Module &module)
{
    build::IRBuilder b(module);
    b.ensureExtern(kRtAlloc, Type(Type::Kind::Ptr), {Type(Type::Kind::I64), Type(Type::Kind::I1)});
    b.ensureExtern(kRtTrapUnreachable,
                   Type(Type::Kind::Void),
                   {Type(Type::Kind::Str), Type(Type::Kind::Ptr)});
}

} // namespace

LoweringReport lowerModule(Module &module,
                           const LoweringOptions &options,
                           const LoweringOracles &oracles)
{
    std::optional<NaturalLayoutOracle> defaultLayout;
    std::optional<ClassHierarchy> defaultDispatch;
    const LayoutOracle *layout = oracles.layout;
    if (!layout)
        layout = &defaultLayout.emplace(options.target.pointerBytes);
    const DispatchOracle *dispatch = oracles.dispatch;
    if (!dispatch)
        dispatch = &defaultDispatch.emplace(module);
    GreedyVTablePopulator greedy;
    const VTablePopulator &populator = oracles.populator ? *oracles.populator : greedy;

    declareRuntime(module);

    LoweringContext ctx(module, options, *layout, *dispatch);
    LoweringReport report;
    for (auto &fn : module.functions)
    {
        if (!fn.hasBody())
            continue;
        FunctionLowerer lowerer(ctx, fn);
        lowerer.run();
        report.unreachableSites += lowerer.unreachableSites();
        ++report.functionsLowered;
    }

    report.constantsVisited = scavengeConstants(module, ctx.registry());

    VTablePlan plan = populator.plan(module, ctx.registry(), options.target.pointerBytes);
    report.slotsResolved = applyVTablePlan(module, plan);
    report.requests = ctx.registry().requests().size();
    report.vtables = module.vtables.size();
    report.notes = ctx.diagnostics().diagnostics();

    if (std::ostream *os = ctx.trace())
    {
        for (const auto &req : ctx.registry().requests())
            *os << "[lower] request #" << req.id << " " << req.name << ": " << req.type.toString()
                << " x" << req.entries.size() << " at +" << plan.requestOffsets[req.id] << "\n";
        *os << "[lower] " << report.functionsLowered << " functions, " << report.requests
            << " requests, " << report.vtables << " vtables, " << report.constantsVisited
            << " constants\n";
    }

    if (options.verify)
    {
        auto verified = verify::Verifier::verify(module, verify::Stage::Lowered);
        if (!verified)
            support::fatal(verified.error().loc,
                           "object lowering produced invalid IR: " + verified.error().message);
    }
    return report;
}

void LowerObjectsPass::run(Module &module)
{
    report_ = lowerModule(module, options_);
}

void registerLowerObjectsPass(transform::PassRegistry &registry, const LoweringOptions &options)
{
    registry.registerModulePass("lower-objects",
                                [options]() -> std::unique_ptr<transform::ModulePass>
                                { return std::make_unique<LowerObjectsPass>(options); });
}

} // namespace kiln::lower
