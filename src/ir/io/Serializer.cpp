//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the textual serializer for IR modules. Every opcode is rendered
// through a per-opcode formatter table; opcodes without a dedicated entry print
// their operand list.
//
//===----------------------------------------------------------------------===//

#include "ir/io/Serializer.hpp"

#include "ir/core/BasicBlock.hpp"
#include "ir/core/Function.hpp"
#include "ir/core/Instr.hpp"
#include "ir/core/Module.hpp"
#include "ir/core/OpcodeInfo.hpp"
#include "ir/core/Value.hpp"

#include <array>
#include <sstream>

namespace kiln::io
{

using namespace kiln::core;

namespace
{

struct SerializeContext
{
    const Module *module = nullptr;

    [[nodiscard]] std::string className(ClassId id) const
    {
        if (module)
            if (const ClassDecl *cls = module->findClass(id))
                return cls->name;
        return "#" + std::to_string(id);
    }
};

using Formatter = void (*)(const Instr &, std::ostream &, const SerializeContext &);

constexpr size_t toIndex(Opcode op)
{
    return static_cast<size_t>(op);
}

void printValueList(std::ostream &os, const std::vector<Value> &values, size_t first = 0)
{
    for (size_t i = first; i < values.size(); ++i)
    {
        if (i != first)
            os << ", ";
        os << toString(values[i]);
    }
}

void printDefaultOperands(const Instr &instr, std::ostream &os, const SerializeContext &)
{
    if (instr.operands.empty())
        return;
    os << ' ';
    printValueList(os, instr.operands);
}

void printBranchTarget(const Instr &instr, size_t idx, std::ostream &os)
{
    os << instr.labels[idx];
    if (idx < instr.brArgs.size() && !instr.brArgs[idx].empty())
    {
        os << '(';
        printValueList(os, instr.brArgs[idx]);
        os << ')';
    }
}

void printTargets(const Instr &instr, size_t first, std::ostream &os)
{
    for (size_t i = first; i < instr.labels.size(); ++i)
    {
        os << (i == first ? " " : ", ");
        printBranchTarget(instr, i, os);
    }
}

void printMemAttrs(const Instr &instr, std::ostream &os)
{
    if (instr.MemAttr.cacheable)
        os << " !cacheable";
    if (instr.type.kind == Type::Kind::I1 && instr.MemAttr.bit != 0)
        os << " !bit " << static_cast<unsigned>(instr.MemAttr.bit);
}

void printLoadOperands(const Instr &instr, std::ostream &os, const SerializeContext &ctx)
{
    os << ' ' << instr.type.toString();
    printDefaultOperands(instr, os, ctx);
    printMemAttrs(instr, os);
}

void printStoreOperands(const Instr &instr, std::ostream &os, const SerializeContext &ctx)
{
    printLoadOperands(instr, os, ctx);
}

void printCallOperands(const Instr &instr, std::ostream &os, const SerializeContext &)
{
    os << " @" << instr.callee << '(';
    printValueList(os, instr.operands);
    os << ')';
}

void printIndirectCallOperands(const Instr &instr, std::ostream &os, const SerializeContext &)
{
    os << ' ' << toString(instr.operands.front()) << '(';
    printValueList(os, instr.operands, 1);
    os << ')';
    if (instr.op == Opcode::InvokeIndirect)
    {
        os << " to";
        printTargets(instr, 0, os);
    }
}

void printBrOperands(const Instr &instr, std::ostream &os, const SerializeContext &)
{
    printTargets(instr, 0, os);
}

void printCBrOperands(const Instr &instr, std::ostream &os, const SerializeContext &)
{
    os << ' ' << toString(instr.operands.front()) << ',';
    printTargets(instr, 0, os);
}

void printSwitchI32Operands(const Instr &instr, std::ostream &os, const SerializeContext &)
{
    os << ' ' << toString(switchScrutinee(instr)) << ", ";
    printBranchTarget(instr, 0, os);
    for (size_t idx = 0; idx < switchCaseCount(instr); ++idx)
    {
        os << ", " << toString(switchCaseValue(instr, idx)) << " -> ";
        printBranchTarget(instr, idx + 1, os);
    }
}

void printIndirectBrOperands(const Instr &instr, std::ostream &os, const SerializeContext &)
{
    os << ' ' << toString(instr.operands.front()) << ", [";
    for (size_t i = 0; i < instr.labels.size(); ++i)
        os << (i ? ", " : "") << instr.labels[i];
    os << ']';
}

void printFieldNames(const Instr &instr, std::ostream &os)
{
    for (const auto &f : instr.fields)
        os << " ." << f;
}

void printObjectOperands(const Instr &instr, std::ostream &os, const SerializeContext &ctx)
{
    os << ' ' << ctx.className(instr.classId);
    printFieldNames(instr, os);
    if (!instr.operands.empty())
    {
        os << ' ';
        printValueList(os, instr.operands);
    }
}

void printVirtualCallOperands(const Instr &instr, std::ostream &os, const SerializeContext &ctx)
{
    os << ' ' << ctx.className(instr.classId) << "::" << instr.callee << '(';
    printValueList(os, instr.operands);
    os << ')';
    if (instr.op == Opcode::VInvoke)
    {
        os << " to";
        printTargets(instr, 0, os);
    }
}

void printTypeSwitchOperands(const Instr &instr, std::ostream &os, const SerializeContext &ctx)
{
    os << ' ' << toString(instr.operands.front()) << " : " << ctx.className(instr.classId);
    for (size_t i = 0; i < instr.labels.size(); ++i)
    {
        os << ", " << ctx.className(instr.caseClasses[i]) << " -> ";
        printBranchTarget(instr, i, os);
    }
}

const Formatter &formatterFor(Opcode op)
{
    static const auto formatters = []
    {
        std::array<Formatter, kNumOpcodes> table;
        table.fill(&printDefaultOperands);
        table[toIndex(Opcode::Load)] = &printLoadOperands;
        table[toIndex(Opcode::Store)] = &printStoreOperands;
        table[toIndex(Opcode::Call)] = &printCallOperands;
        table[toIndex(Opcode::CallIndirect)] = &printIndirectCallOperands;
        table[toIndex(Opcode::InvokeIndirect)] = &printIndirectCallOperands;
        table[toIndex(Opcode::Br)] = &printBrOperands;
        table[toIndex(Opcode::CBr)] = &printCBrOperands;
        table[toIndex(Opcode::SwitchI32)] = &printSwitchI32Operands;
        table[toIndex(Opcode::IndirectBr)] = &printIndirectBrOperands;
        for (Opcode obj : {Opcode::ObjNew,
                           Opcode::ObjGet,
                           Opcode::ObjSet,
                           Opcode::ObjWith,
                           Opcode::ArrNew,
                           Opcode::ArrAlloc,
                           Opcode::ArrClone,
                           Opcode::ArrGet,
                           Opcode::ArrSet,
                           Opcode::ArrSize,
                           Opcode::ArrHash,
                           Opcode::Freeze})
            table[toIndex(obj)] = &printObjectOperands;
        table[toIndex(Opcode::VCall)] = &printVirtualCallOperands;
        table[toIndex(Opcode::VInvoke)] = &printVirtualCallOperands;
        table[toIndex(Opcode::TypeSwitch)] = &printTypeSwitchOperands;
        return table;
    }();
    return formatters[toIndex(op)];
}

void printInstr(const Instr &in, std::ostream &os, const SerializeContext &ctx)
{
    if (in.result)
        os << "%t" << *in.result << ':' << in.type.toString() << " = ";
    os << toString(in.op);
    formatterFor(in.op)(in, os, ctx);
}

void printClass(const ClassDecl &cls, const SerializeContext &ctx, std::ostream &os)
{
    os << "class " << cls.name << " #" << cls.id;
    os << (cls.isReference() ? " ref" : " value");
    if (cls.isArray())
        os << " array";
    if (cls.isAbstract)
        os << " abstract";
    if (cls.parent)
        os << " : " << ctx.className(*cls.parent);
    os << " {";
    for (const auto &f : cls.fields)
        os << ' ' << f.name << ':' << f.type.toString() << ';';
    for (const auto &m : cls.methods)
        os << ' ' << m.name << " = @" << m.entry << ';';
    os << " }\n";
}

void printFunction(const Function &f, const SerializeContext &ctx, std::ostream &os)
{
    os << "func @" << f.name << "(";
    for (size_t i = 0; i < f.params.size(); ++i)
    {
        if (i)
            os << ", ";
        os << f.params[i].type.toString() << " %t" << f.params[i].id;
    }
    os << ") -> " << f.retType.toString();
    if (!f.hasBody())
    {
        os << "\n";
        return;
    }
    os << " {\n";
    for (const auto &bb : f.blocks)
    {
        os << bb.label;
        if (!bb.params.empty())
        {
            os << '(';
            for (size_t i = 0; i < bb.params.size(); ++i)
                os << (i ? ", " : "") << "%t" << bb.params[i].id << ':'
                   << bb.params[i].type.toString();
            os << ')';
        }
        os << ":\n";
        for (const auto &in : bb.instructions)
        {
            os << "  ";
            printInstr(in, os, ctx);
            os << "\n";
        }
    }
    os << "}\n";
}

} // namespace

void Serializer::write(const Module &m, std::ostream &os)
{
    SerializeContext ctx{&m};
    os << "kiln " << m.version << "\n";
    for (const auto &cls : m.classes)
        printClass(cls, ctx, os);
    for (const auto &e : m.externs)
    {
        os << "extern @" << e.name << "(";
        for (size_t i = 0; i < e.params.size(); ++i)
            os << (i ? ", " : "") << e.params[i].toString();
        os << ") -> " << e.retType.toString() << "\n";
    }
    for (const auto &g : m.globals)
    {
        os << "global " << g.type.toString() << " @" << g.name;
        if (g.constRoot)
            os << " = const#" << *g.constRoot;
        else if (!g.init.empty())
            os << " = " << core::toString(Value::constStr(g.init));
        os << "\n";
    }
    for (const auto &c : m.constants)
    {
        os << "const#" << c.id << " " << ctx.className(c.classId) << " {";
        for (const auto &f : c.fields)
            os << ' ' << (f.ref ? "const#" + std::to_string(*f.ref) : core::toString(f.value)) << ';';
        os << " }\n";
    }
    for (const auto &vt : m.vtables)
    {
        os << "vtable @" << vt.symbol << " size " << vt.sizeBytes << " {";
        for (const auto &slot : vt.slots)
            os << ' ' << slot.offset << ": " << slot.type.toString() << ' ' << core::toString(slot.value)
               << ';';
        os << " }\n";
    }
    for (const auto &f : m.functions)
        printFunction(f, ctx, os);
}

void Serializer::writeFunction(const Module &m, const Function &fn, std::ostream &os)
{
    printFunction(fn, SerializeContext{&m}, os);
}

std::string Serializer::instrToString(const Module &m, const Instr &instr)
{
    std::ostringstream oss;
    printInstr(instr, oss, SerializeContext{&m});
    return oss.str();
}

std::string Serializer::toString(const Module &m)
{
    std::ostringstream oss;
    write(m, oss);
    return oss.str();
}

} // namespace kiln::io
