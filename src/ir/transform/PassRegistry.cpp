//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the pass registry. Callable registrations are wrapped in a small
// adapter pass so that the executor only ever deals with ModulePass objects.
//
//===----------------------------------------------------------------------===//

#include "ir/transform/PassRegistry.hpp"

#include "ir/core/Module.hpp"

#include <utility>

namespace kiln::transform
{

namespace
{

class LambdaModulePass final : public ModulePass
{
  public:
    LambdaModulePass(std::string id, std::function<void(core::Module &)> fn)
        : id_(std::move(id)), fn_(std::move(fn))
    {
    }

    std::string_view id() const override
    {
        return id_;
    }

    void run(core::Module &module) override
    {
        fn_(module);
    }

  private:
    std::string id_;
    std::function<void(core::Module &)> fn_;
};

} // namespace

void PassRegistry::registerModulePass(const std::string &id, ModulePassFactory factory)
{
    registry_[id] = std::move(factory);
}

void PassRegistry::registerModulePass(const std::string &id,
                                      const std::function<void(core::Module &)> &fn)
{
    registry_[id] = [id, fn]() { return std::make_unique<LambdaModulePass>(id, fn); };
}

const PassRegistry::ModulePassFactory *PassRegistry::lookup(std::string_view id) const
{
    auto it = registry_.find(std::string(id));
    if (it == registry_.end())
        return nullptr;
    return &it->second;
}

} // namespace kiln::transform
