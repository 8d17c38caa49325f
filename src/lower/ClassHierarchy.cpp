//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the whole-program class hierarchy oracle.
//
//===----------------------------------------------------------------------===//

#include "lower/ClassHierarchy.hpp"

#include "ir/core/Module.hpp"
#include "support/internal_error.hpp"

namespace kiln::lower
{

using namespace kiln::core;

ClassHierarchy::ClassHierarchy(const Module &module) : module_(module)
{
    for (const auto &fn : module.functions)
    {
        for (const auto &bb : fn.blocks)
        {
            for (const auto &in : bb.instructions)
            {
                switch (in.op)
                {
                    case Opcode::ObjNew:
                    case Opcode::ArrNew:
                    case Opcode::ArrAlloc:
                    case Opcode::ArrClone:
                        instantiated_.insert(in.classId);
                        break;
                    default:
                        break;
                }
            }
        }
    }
    for (const auto &c : module.constants)
        instantiated_.insert(c.classId);
}

bool ClassHierarchy::isSubclassOf(ClassId sub, ClassId super) const
{
    std::optional<ClassId> cur = sub;
    while (cur)
    {
        if (*cur == super)
            return true;
        const ClassDecl *d = module_.findClass(*cur);
        if (!d)
            return false;
        cur = d->parent;
    }
    return false;
}

std::vector<ClassId> ClassHierarchy::concreteSubclasses(ClassId cls) const
{
    std::vector<ClassId> out;
    for (const auto &c : module_.classes)
        if (!c.isAbstract && isInstantiated(c.id) && isSubclassOf(c.id, cls))
            out.push_back(c.id);
    return out;
}

std::string ClassHierarchy::resolveMethod(ClassId cls, const std::string &method) const
{
    std::optional<ClassId> cur = cls;
    while (cur)
    {
        const ClassDecl *d = module_.findClass(*cur);
        if (!d)
            break;
        if (const MethodDecl *m = d->findMethod(method))
            return m->entry;
        cur = d->parent;
    }
    return {};
}

std::vector<Implementation> ClassHierarchy::allImplementations(const Instr &call) const
{
    std::vector<Implementation> out;
    for (ClassId cls : concreteSubclasses(call.classId))
    {
        std::string entry = resolveMethod(cls, call.callee);
        if (entry.empty())
            support::fatal(call.loc,
                           "class '" + module_.findClass(cls)->name +
                               "' does not implement method '" + call.callee + "'");
        out.push_back({cls, std::move(entry)});
    }
    return out;
}

size_t ClassHierarchy::findTypeSwitchSuccessor(ClassId cls, const std::vector<ClassId> &cases) const
{
    for (size_t i = 0; i < cases.size(); ++i)
        if (isSubclassOf(cls, cases[i]))
            return i;
    return cases.size();
}

Mutability ClassHierarchy::freezeState(ClassId cls) const
{
    const ClassDecl *d = module_.findClass(cls);
    return d ? d->mutability : Mutability::MaybeFrozen;
}

ClassKind ClassHierarchy::classKind(ClassId cls) const
{
    const ClassDecl *d = module_.findClass(cls);
    return d ? d->kind : ClassKind::Reference;
}

} // namespace kiln::lower
