//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the method-resolution oracle consumed by dispatch and
// freeze lowering, and ClassHierarchy, its default whole-program
// implementation.
//
// ClassHierarchy treats a class as concretely reachable when it is not
// abstract and the program instantiates it somewhere: an obj.new, arr.new,
// arr.alloc or arr.clone names it, or a constant object of that class exists.
// Methods are inherited along the parent chain unless overridden.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Class.hpp"
#include "ir/core/fwd.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace kiln::lower
{

/// @brief Concrete class reachable at a call site with the entry point it selects.
struct Implementation
{
    core::ClassId cls = core::kNoClass;
    std::string entry;
};

/// @brief Whole-program dispatch facts.
class DispatchOracle
{
  public:
    virtual ~DispatchOracle() = default;

    /// @brief Every concrete class the receiver of @p call may have, paired
    ///        with the implementation it selects, ordered by class id.
    virtual std::vector<Implementation> allImplementations(const core::Instr &call) const = 0;

    /// @brief Index of the first case in @p cases that instances of @p cls take;
    ///        cases.size() when no case matches.
    virtual size_t findTypeSwitchSuccessor(core::ClassId cls,
                                           const std::vector<core::ClassId> &cases) const = 0;

    /// @brief Concrete classes whose instances have static type @p cls, by id.
    virtual std::vector<core::ClassId> concreteSubclasses(core::ClassId cls) const = 0;

    virtual bool isSubclassOf(core::ClassId sub, core::ClassId super) const = 0;

    virtual core::Mutability freezeState(core::ClassId cls) const = 0;

    virtual core::ClassKind classKind(core::ClassId cls) const = 0;
};

/// @brief DispatchOracle computed from a module's class table and code.
/// @details Ids missing from the class table end superclass walks; the
///          lowering checks every id it passes in against the table first.
class ClassHierarchy final : public DispatchOracle
{
  public:
    explicit ClassHierarchy(const core::Module &module);

    std::vector<Implementation> allImplementations(const core::Instr &call) const override;
    size_t findTypeSwitchSuccessor(core::ClassId cls,
                                   const std::vector<core::ClassId> &cases) const override;
    std::vector<core::ClassId> concreteSubclasses(core::ClassId cls) const override;
    bool isSubclassOf(core::ClassId sub, core::ClassId super) const override;
    core::Mutability freezeState(core::ClassId cls) const override;
    core::ClassKind classKind(core::ClassId cls) const override;

    /// @brief Method entry @p cls uses for @p method; empty when none.
    std::string resolveMethod(core::ClassId cls, const std::string &method) const;

    [[nodiscard]] bool isInstantiated(core::ClassId cls) const
    {
        return instantiated_.count(cls) != 0;
    }

  private:
    const core::Module &module_;
    std::unordered_set<core::ClassId> instantiated_;
};

} // namespace kiln::lower
