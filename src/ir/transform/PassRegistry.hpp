//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the pass interface and the registry used to materialise
// passes by identifier. Passes operate on whole modules; the lowering pass
// needs module-wide state (the vtable request registry and the class table),
// so no per-function pass flavour is provided.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/fwd.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kiln::transform
{

/// @brief Transformation over a whole module.
class ModulePass
{
  public:
    virtual ~ModulePass() = default;

    /// @brief Unique identifier for this pass.
    virtual std::string_view id() const = 0;

    /// @brief Execute the transformation on the module.
    virtual void run(core::Module &module) = 0;

    /// @brief True when the module no longer contains object-model
    ///        instructions after this pass ran.
    virtual bool lowersObjectModel() const
    {
        return false;
    }
};

/// @brief Maps pass identifiers to factories.
class PassRegistry
{
  public:
    using ModulePassFactory = std::function<std::unique_ptr<ModulePass>()>;

    /// @brief Register a module pass using a factory function.
    void registerModulePass(const std::string &id, ModulePassFactory factory);

    /// @brief Register a simple module pass implemented by a callable.
    void registerModulePass(const std::string &id, const std::function<void(core::Module &)> &fn);

    /// @brief Look up a registered pass by identifier; nullptr when unknown.
    const ModulePassFactory *lookup(std::string_view id) const;

  private:
    std::unordered_map<std::string, ModulePassFactory> registry_;
};

} // namespace kiln::transform
