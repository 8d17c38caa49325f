//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the PassManager, which runs named pipelines of module
// passes with optional instrumentation: printing the module before or after
// each pass and verifying it between passes. Verification switches to the
// lowered rule set once a pass reporting lowersObjectModel() has run.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/fwd.hpp"
#include "ir/transform/PassRegistry.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kiln::transform
{

class PassManager
{
  public:
    using Pipeline = std::vector<std::string>;

    PassManager() = default;

    PassRegistry &passes()
    {
        return passRegistry_;
    }

    const PassRegistry &passes() const
    {
        return passRegistry_;
    }

    void registerModulePass(const std::string &id, PassRegistry::ModulePassFactory factory)
    {
        passRegistry_.registerModulePass(id, std::move(factory));
    }

    void registerModulePass(const std::string &id, const std::function<void(core::Module &)> &fn)
    {
        passRegistry_.registerModulePass(id, fn);
    }

    /// @brief Register a named pipeline of pass identifiers.
    void registerPipeline(const std::string &id, Pipeline pipeline);

    /// @brief Look up a registered pipeline by name; nullptr when unknown.
    const Pipeline *getPipeline(const std::string &id) const;

    void setVerifyBetweenPasses(bool enable)
    {
        verifyBetweenPasses_ = enable;
    }

    void setPrintBeforeEach(bool enable)
    {
        printBeforeEach_ = enable;
    }

    void setPrintAfterEach(bool enable)
    {
        printAfterEach_ = enable;
    }

    void setInstrumentationStream(std::ostream &os)
    {
        instrumentationStream_ = &os;
    }

    /// @brief Execute @p pipeline on @p module.
    /// @return Error naming the first unknown pass or the first verification failure.
    support::Expected<void> run(core::Module &module, const Pipeline &pipeline) const;

    /// @brief Execute a registered pipeline by name.
    support::Expected<void> runPipeline(core::Module &module, const std::string &pipelineId) const;

  private:
    PassRegistry passRegistry_;
    std::unordered_map<std::string, Pipeline> pipelines_;
    bool verifyBetweenPasses_ = false;
    bool printBeforeEach_ = false;
    bool printAfterEach_ = false;
    std::ostream *instrumentationStream_ = nullptr;
};

} // namespace kiln::transform
