//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Lookup helpers for Module and ClassDecl. All lookups are linear except class
// ids, which index the class table directly.
//
//===----------------------------------------------------------------------===//

#include "ir/core/Module.hpp"

#include <algorithm>

namespace kiln::core
{

const MethodDecl *ClassDecl::findMethod(const std::string &methodName) const
{
    auto it = std::find_if(
        methods.begin(), methods.end(), [&](const MethodDecl &m) { return m.name == methodName; });
    return it == methods.end() ? nullptr : &*it;
}

const ClassDecl *Module::findClass(ClassId id) const
{
    if (id < classes.size() && classes[id].id == id)
        return &classes[id];
    for (const auto &c : classes)
        if (c.id == id)
            return &c;
    return nullptr;
}

const ClassDecl *Module::findClass(const std::string &name) const
{
    for (const auto &c : classes)
        if (c.name == name)
            return &c;
    return nullptr;
}

Function *Module::findFunction(const std::string &name)
{
    for (auto &f : functions)
        if (f.name == name)
            return &f;
    return nullptr;
}

const Function *Module::findFunction(const std::string &name) const
{
    for (const auto &f : functions)
        if (f.name == name)
            return &f;
    return nullptr;
}

const Extern *Module::findExtern(const std::string &name) const
{
    for (const auto &e : externs)
        if (e.name == name)
            return &e;
    return nullptr;
}

const ConstObject *Module::findConstant(unsigned id) const
{
    for (const auto &c : constants)
        if (c.id == id)
            return &c;
    return nullptr;
}

const VTable *Module::findVTable(ClassId id) const
{
    for (const auto &vt : vtables)
        if (vt.classId == id)
            return &vt;
    return nullptr;
}

} // namespace kiln::core
