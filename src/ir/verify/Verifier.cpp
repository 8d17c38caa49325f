//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements module verification. Checks are ordered class table, functions
// (blocks, then instructions), so that later checks can rely on names and
// labels resolving.
//
//===----------------------------------------------------------------------===//

#include "ir/verify/Verifier.hpp"

#include "ir/core/Module.hpp"
#include "ir/core/OpcodeInfo.hpp"
#include "ir/utils/Utils.hpp"

#include <sstream>
#include <unordered_set>

namespace kiln::verify
{

using namespace kiln::core;
using support::Expected;
using support::makeError;

namespace
{

class FunctionVerifier
{
  public:
    FunctionVerifier(const Module &m, const Function &fn, Stage stage)
        : module_(m), fn_(fn), stage_(stage)
    {
    }

    Expected<void> run()
    {
        if (auto r = collectDefinitions(); !r)
            return r;
        for (const auto &bb : fn_.blocks)
        {
            if (auto r = verifyBlock(bb); !r)
                return r;
        }
        return {};
    }

  private:
    const Module &module_;
    const Function &fn_;
    Stage stage_;
    std::unordered_set<unsigned> defined_;
    std::unordered_set<std::string> labels_;

    support::Diag error(const Instr *in, const BasicBlock *bb, const std::string &msg) const
    {
        std::ostringstream oss;
        oss << "@" << fn_.name;
        if (bb)
            oss << ":" << bb->label;
        if (in)
            oss << ": " << toString(in->op);
        oss << ": " << msg;
        return makeError(in ? in->loc : support::SourceLoc{}, oss.str());
    }

    Expected<void> define(unsigned id, const BasicBlock *bb, const Instr *in)
    {
        if (!defined_.insert(id).second)
            return error(in, bb, "temporary %t" + std::to_string(id) + " defined twice");
        return {};
    }

    Expected<void> collectDefinitions()
    {
        for (const auto &p : fn_.params)
            if (auto r = define(p.id, nullptr, nullptr); !r)
                return r;
        for (const auto &bb : fn_.blocks)
        {
            if (bb.label.empty())
                return error(nullptr, &bb, "block without label");
            if (!labels_.insert(bb.label).second)
                return error(nullptr, &bb, "duplicate block label");
            for (const auto &p : bb.params)
                if (auto r = define(p.id, &bb, nullptr); !r)
                    return r;
            for (const auto &in : bb.instructions)
                if (in.result)
                    if (auto r = define(*in.result, &bb, &in); !r)
                        return r;
        }
        return {};
    }

    Expected<void> verifyBlock(const BasicBlock &bb)
    {
        if (bb.instructions.empty())
            return error(nullptr, &bb, "empty block");
        for (size_t i = 0; i < bb.instructions.size(); ++i)
        {
            const Instr &in = bb.instructions[i];
            const bool last = i + 1 == bb.instructions.size();
            if (isTerminator(in.op) != last)
                return error(&in,
                             &bb,
                             last ? "block must end with a terminator"
                                  : "terminator before end of block");
            if (auto r = verifyInstr(bb, in); !r)
                return r;
        }
        return {};
    }

    Expected<void> verifyValue(const BasicBlock &bb, const Instr &in, const Value &v)
    {
        if (v.kind == Value::Kind::Temp && !defined_.count(v.id))
            return error(&in, &bb, "use of undefined temporary %t" + std::to_string(v.id));
        if (v.kind == Value::Kind::VTableSlot && stage_ == Stage::Lowered)
            return error(&in, &bb, "unresolved vtable slot " + toString(v));
        if (v.kind == Value::Kind::BlockAddr && v.str == fn_.name && !labels_.count(v.label))
            return error(&in, &bb, "block address of unknown label " + v.label);
        return {};
    }

    Expected<void> verifySuccessors(const BasicBlock &bb, const Instr &in)
    {
        if (!in.brArgs.empty() && in.brArgs.size() != in.labels.size())
            return error(&in, &bb, "branch argument lists do not match successors");
        for (size_t i = 0; i < in.labels.size(); ++i)
        {
            const BasicBlock *target = util::findBlock(fn_, in.labels[i]);
            if (!target)
                return error(&in, &bb, "unknown successor " + in.labels[i]);
            const size_t nargs = i < in.brArgs.size() ? in.brArgs[i].size() : 0;
            if (nargs != target->params.size())
                return error(&in, &bb, "argument count mismatch for successor " + in.labels[i]);
        }
        return {};
    }

    Expected<void> verifyClassPayload(const BasicBlock &bb, const Instr &in)
    {
        const ClassDecl *cls = module_.findClass(in.classId);
        if (!cls)
            return error(&in, &bb, "unknown class id " + std::to_string(in.classId));
        if (in.op == Opcode::TypeSwitch)
        {
            if (in.caseClasses.size() != in.labels.size())
                return error(&in, &bb, "case classes do not match successors");
            for (ClassId c : in.caseClasses)
                if (!module_.findClass(c))
                    return error(&in, &bb, "unknown case class id " + std::to_string(c));
        }
        return {};
    }

    Expected<void> verifyInstr(const BasicBlock &bb, const Instr &in)
    {
        const OpcodeInfo &info = getOpcodeInfo(in.op);
        if (info.resultArity == ResultArity::One && !in.result)
            return error(&in, &bb, "missing result");
        if (info.resultArity == ResultArity::None && in.result)
            return error(&in, &bb, "unexpected result");

        if (info.isObjectModel)
        {
            if (stage_ == Stage::Lowered)
                return error(&in, &bb, "object-model instruction survived lowering");
            if (auto r = verifyClassPayload(bb, in); !r)
                return r;
        }

        for (const auto &v : in.operands)
            if (auto r = verifyValue(bb, in, v); !r)
                return r;
        for (const auto &args : in.brArgs)
            for (const auto &v : args)
                if (auto r = verifyValue(bb, in, v); !r)
                    return r;

        if (in.op == Opcode::Call && !module_.findFunction(in.callee) &&
            !module_.findExtern(in.callee))
            return error(&in, &bb, "unknown callee @" + in.callee);
        if ((in.op == Opcode::CallIndirect || in.op == Opcode::InvokeIndirect ||
             in.op == Opcode::IndirectBr) &&
            in.operands.empty())
            return error(&in, &bb, "missing target operand");

        if (isTerminator(in.op))
            return verifySuccessors(bb, in);
        return {};
    }
};

} // namespace

Expected<void> Verifier::verify(const Module &m, Stage stage)
{
    for (size_t i = 0; i < m.classes.size(); ++i)
    {
        const ClassDecl &cls = m.classes[i];
        if (cls.id != i)
            return makeError({}, "class '" + cls.name + "' has id " + std::to_string(cls.id) +
                                     " at table index " + std::to_string(i));
        if (cls.parent && !m.findClass(*cls.parent))
            return makeError({}, "class '" + cls.name + "' has unknown parent");
    }

    std::unordered_set<std::string> names;
    for (const auto &fn : m.functions)
    {
        if (!names.insert(fn.name).second)
            return makeError({}, "duplicate function @" + fn.name);
        if (!fn.hasBody())
            continue;
        FunctionVerifier fv(m, fn, stage);
        if (auto r = fv.run(); !r)
            return r;
    }

    for (const auto &g : m.globals)
        if (g.constRoot && !m.findConstant(*g.constRoot))
            return makeError({}, "global @" + g.name + " names unknown constant");
    return {};
}

} // namespace kiln::verify
