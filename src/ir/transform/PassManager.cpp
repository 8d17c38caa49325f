//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements pipeline execution for the PassManager.
//
//===----------------------------------------------------------------------===//

#include "ir/transform/PassManager.hpp"

#include "ir/core/Module.hpp"
#include "ir/io/Serializer.hpp"
#include "ir/verify/Verifier.hpp"

#include <ostream>

namespace kiln::transform
{

void PassManager::registerPipeline(const std::string &id, Pipeline pipeline)
{
    pipelines_[id] = std::move(pipeline);
}

const PassManager::Pipeline *PassManager::getPipeline(const std::string &id) const
{
    auto it = pipelines_.find(id);
    if (it == pipelines_.end())
        return nullptr;
    return &it->second;
}

support::Expected<void> PassManager::run(core::Module &module, const Pipeline &pipeline) const
{
    verify::Stage stage = verify::Stage::HighLevel;
    for (const auto &passId : pipeline)
    {
        const PassRegistry::ModulePassFactory *factory = passRegistry_.lookup(passId);
        if (!factory || !*factory)
            return support::makeError({}, "unknown pass '" + passId + "'");
        auto pass = (*factory)();
        if (!pass)
            return support::makeError({}, "pass '" + passId + "' could not be created");

        if (printBeforeEach_ && instrumentationStream_)
        {
            *instrumentationStream_ << "*** IR before pass '" << passId << "' ***\n";
            io::Serializer::write(module, *instrumentationStream_);
            *instrumentationStream_ << "\n";
        }

        pass->run(module);
        if (pass->lowersObjectModel())
            stage = verify::Stage::Lowered;

        if (printAfterEach_ && instrumentationStream_)
        {
            *instrumentationStream_ << "*** IR after pass '" << passId << "' ***\n";
            io::Serializer::write(module, *instrumentationStream_);
            *instrumentationStream_ << "\n";
        }

        if (verifyBetweenPasses_)
        {
            auto verified = verify::Verifier::verify(module, stage);
            if (!verified)
            {
                auto diag = verified.error();
                diag.message = "after pass '" + passId + "': " + diag.message;
                return diag;
            }
        }
    }
    return {};
}

support::Expected<void> PassManager::runPipeline(core::Module &module,
                                                 const std::string &pipelineId) const
{
    const Pipeline *pipeline = getPipeline(pipelineId);
    if (!pipeline)
        return support::makeError({}, "unknown pipeline '" + pipelineId + "'");
    return run(module, *pipeline);
}

} // namespace kiln::transform
