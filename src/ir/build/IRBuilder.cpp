//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/build/IRBuilder.cpp
// Purpose: Provide a structured API for constructing IR modules programmatically.
// Key invariants: Builder maintains a current function/block insertion context
//                 and monotonically increasing SSA identifiers.
// Ownership/Lifetime: Builder references a module owned by the caller.
// Links: ir/core/Instr.hpp
//
//===----------------------------------------------------------------------===//

#include "ir/build/IRBuilder.hpp"

#include "ir/core/OpcodeInfo.hpp"

#include <cassert>
#include <stdexcept>

namespace kiln::build
{

using namespace kiln::core;

namespace
{

#ifndef NDEBUG
void assertUniqueLabelInFunction(const Function &fn, const std::string &label)
{
    for (const auto &block : fn.blocks)
    {
        assert(block.label != label && "block label already exists in function");
    }
}

void assertValidParamTypes(const std::vector<Param> &params)
{
    for (const auto &p : params)
    {
        assert(p.type.kind != Type::Kind::Void && "parameter cannot have Void type");
    }
}
#endif // NDEBUG

bool labelInUse(const Function &fn, const std::string &label)
{
    for (const auto &block : fn.blocks)
        if (block.label == label)
            return true;
    return false;
}

Type voidTy()
{
    return Type(Type::Kind::Void);
}

Type ptrTy()
{
    return Type(Type::Kind::Ptr);
}

Type i64Ty()
{
    return Type(Type::Kind::I64);
}

} // namespace

IRBuilder::IRBuilder(Module &m) : mod(m) {}

//===----------------------------------------------------------------------===//
// Module level
//===----------------------------------------------------------------------===//

Extern &IRBuilder::addExtern(const std::string &name, Type ret, const std::vector<Type> &params)
{
    assert(!name.empty() && "extern name cannot be empty");
    assert(mod.findExtern(name) == nullptr && "extern name already exists in module");
    mod.externs.push_back({name, ret, params});
    return mod.externs.back();
}

void IRBuilder::ensureExtern(const std::string &name, Type ret, const std::vector<Type> &params)
{
    if (const Extern *existing = mod.findExtern(name))
    {
        if (existing->retType != ret || existing->params != params)
            throw std::logic_error("extern '" + name + "' redeclared with a different signature");
        return;
    }
    addExtern(name, ret, params);
}

Global &IRBuilder::addGlobal(const std::string &name, Type type, const std::string &init)
{
    assert(!name.empty() && "global name cannot be empty");
    mod.globals.push_back({name, type, init, std::nullopt});
    return mod.globals.back();
}

Global &IRBuilder::addGlobalStr(const std::string &name, const std::string &value)
{
    return addGlobal(name, Type(Type::Kind::Str), value);
}

ClassId IRBuilder::addClass(ClassDecl decl)
{
    decl.id = static_cast<ClassId>(mod.classes.size());
    if (decl.parent && *decl.parent >= decl.id)
        throw std::logic_error("class '" + decl.name + "' must be declared after its parent");
    mod.classes.push_back(std::move(decl));
    return mod.classes.back().id;
}

unsigned IRBuilder::addConstant(ClassId cls, std::vector<ConstField> fields)
{
    unsigned id = static_cast<unsigned>(mod.constants.size());
    mod.constants.push_back({id, cls, std::move(fields)});
    return id;
}

//===----------------------------------------------------------------------===//
// Functions and blocks
//===----------------------------------------------------------------------===//

Function &IRBuilder::startFunction(const std::string &name,
                                   Type ret,
                                   const std::vector<Param> &params)
{
    assert(!name.empty() && "function name cannot be empty");
#ifndef NDEBUG
    assertValidParamTypes(params);
#endif
    mod.functions.push_back({name, ret, {}, {}, {}});
    curFunc = &mod.functions.back();
    curBlock.reset();
    nextTemp = 0;
    labelCounters.clear();
    for (auto p : params)
    {
        Param np = p;
        np.id = nextTemp++;
        curFunc->params.push_back(np);
    }
    curFunc->valueNames.resize(nextTemp);
    for (const auto &p : curFunc->params)
        curFunc->valueNames[p.id] = p.name;
    return *curFunc;
}

void IRBuilder::resumeFunction(Function &fn, unsigned next)
{
    curFunc = &fn;
    curBlock.reset();
    nextTemp = next;
    labelCounters.clear();
}

BasicBlock &IRBuilder::createBlock(Function &fn,
                                   const std::string &label,
                                   const std::vector<Param> &params)
{
    assert(!label.empty() && "block label cannot be empty");
#ifndef NDEBUG
    assertUniqueLabelInFunction(fn, label);
    assertValidParamTypes(params);
#endif
    fn.blocks.push_back({label, {}, {}, false});
    BasicBlock &bb = fn.blocks.back();
    for (auto p : params)
    {
        Param np = p;
        np.id = nextTemp++;
        bb.params.push_back(np);
        if (fn.valueNames.size() <= np.id)
            fn.valueNames.resize(np.id + 1);
        fn.valueNames[np.id] = np.name;
    }
    return bb;
}

std::string IRBuilder::uniqueLabel(const std::string &hint)
{
    assert(curFunc && "no active function");
    unsigned &counter = labelCounters[hint];
    std::string label;
    do
    {
        label = hint + "." + std::to_string(counter++);
    } while (labelInUse(*curFunc, label));
    return label;
}

BasicBlock &IRBuilder::createUniqueBlock(const std::string &hint, const std::vector<Param> &params)
{
    std::string label = uniqueLabel(hint);
    return createBlock(*curFunc, label, params);
}

Value IRBuilder::blockParam(const BasicBlock &bb, unsigned idx) const
{
    assert(idx < bb.params.size());
    return Value::temp(bb.params[idx].id);
}

void IRBuilder::setInsertPoint(BasicBlock &bb)
{
    assert(curFunc && "no active function");
    assert(&bb >= curFunc->blocks.data() && &bb < curFunc->blocks.data() + curFunc->blocks.size() &&
           "insert block must belong to the active function");
    curBlock = static_cast<size_t>(&bb - curFunc->blocks.data());
}

BasicBlock &IRBuilder::insertBlock()
{
    assert(hasInsertPoint() && "insert point not set");
    return curFunc->blocks[*curBlock];
}

Function &IRBuilder::function()
{
    assert(curFunc && "no active function");
    return *curFunc;
}

unsigned IRBuilder::reserveTempId()
{
    assert(curFunc && "no active function");
    unsigned id = nextTemp++;
    if (curFunc->valueNames.size() <= id)
        curFunc->valueNames.resize(id + 1);
    return id;
}

Instr &IRBuilder::append(Instr instr)
{
    BasicBlock &bb = insertBlock();
    assert(!bb.terminated && "cannot append to a terminated block");
    if (instr.loc.line == 0 && instr.loc.file_id == 0)
        instr.loc = curLoc;
    if (isTerminator(instr.op))
        bb.terminated = true;
    bb.instructions.push_back(std::move(instr));
    return bb.instructions.back();
}

Value IRBuilder::emitValue(Opcode op, Type ty, std::vector<Value> operands)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = op;
    instr.type = ty;
    instr.operands = std::move(operands);
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

//===----------------------------------------------------------------------===//
// Low-level instructions
//===----------------------------------------------------------------------===//

Value IRBuilder::binary(Opcode op, Type ty, Value lhs, Value rhs)
{
    return emitValue(op, ty, {std::move(lhs), std::move(rhs)});
}

Value IRBuilder::add(Type ty, Value lhs, Value rhs)
{
    return binary(Opcode::Add, ty, std::move(lhs), std::move(rhs));
}

Value IRBuilder::mul(Type ty, Value lhs, Value rhs)
{
    return binary(Opcode::Mul, ty, std::move(lhs), std::move(rhs));
}

Value IRBuilder::andBits(Type ty, Value lhs, Value rhs)
{
    return binary(Opcode::And, ty, std::move(lhs), std::move(rhs));
}

Value IRBuilder::orBits(Type ty, Value lhs, Value rhs)
{
    return binary(Opcode::Or, ty, std::move(lhs), std::move(rhs));
}

Value IRBuilder::icmpNe(Value lhs, Value rhs)
{
    return binary(Opcode::ICmpNe, Type(Type::Kind::I1), std::move(lhs), std::move(rhs));
}

Value IRBuilder::zext(Type to, Value v)
{
    return emitValue(Opcode::Zext, to, {std::move(v)});
}

Value IRBuilder::trunc(Type to, Value v)
{
    return emitValue(Opcode::Trunc, to, {std::move(v)});
}

Value IRBuilder::gep(Value base, Value offset)
{
    return emitValue(Opcode::GEP, ptrTy(), {std::move(base), std::move(offset)});
}

Value IRBuilder::load(Type ty, Value ptr, Value offset, MemAttrs attrs)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::Load;
    instr.type = ty;
    instr.operands = {std::move(ptr), std::move(offset)};
    instr.MemAttr = attrs;
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

void IRBuilder::store(Type ty, Value ptr, Value offset, Value value, MemAttrs attrs)
{
    Instr instr;
    instr.op = Opcode::Store;
    instr.type = ty;
    instr.operands = {std::move(ptr), std::move(offset), std::move(value)};
    instr.MemAttr = attrs;
    append(std::move(instr));
}

void IRBuilder::memcpy(Value dst, Value src, Value bytes)
{
    Instr instr;
    instr.op = Opcode::MemCopy;
    instr.type = voidTy();
    instr.operands = {std::move(dst), std::move(src), std::move(bytes)};
    append(std::move(instr));
}

std::optional<Value> IRBuilder::call(const std::string &callee, Type ret, const std::vector<Value> &args)
{
    Instr instr;
    instr.op = Opcode::Call;
    instr.type = ret;
    instr.callee = callee;
    instr.operands = args;
    std::optional<Value> result;
    if (ret.kind != Type::Kind::Void)
    {
        instr.result = reserveTempId();
        result = Value::temp(*instr.result);
    }
    append(std::move(instr));
    return result;
}

void IRBuilder::callIndirect(Type ret,
                             Value target,
                             const std::vector<Value> &args,
                             std::optional<unsigned> resultId)
{
    Instr instr;
    instr.op = Opcode::CallIndirect;
    instr.type = ret;
    instr.result = resultId;
    instr.operands.reserve(args.size() + 1);
    instr.operands.push_back(std::move(target));
    instr.operands.insert(instr.operands.end(), args.begin(), args.end());
    append(std::move(instr));
}

void IRBuilder::invokeIndirect(Type ret,
                               Value target,
                               const std::vector<Value> &args,
                               std::optional<unsigned> resultId,
                               const std::string &normal,
                               const std::string &unwind)
{
    Instr instr;
    instr.op = Opcode::InvokeIndirect;
    instr.type = ret;
    instr.result = resultId;
    instr.operands.reserve(args.size() + 1);
    instr.operands.push_back(std::move(target));
    instr.operands.insert(instr.operands.end(), args.begin(), args.end());
    instr.labels = {normal, unwind};
    instr.brArgs = {{}, {}};
    append(std::move(instr));
}

Value IRBuilder::extract(Type ty, Value agg, unsigned index)
{
    return emitValue(Opcode::Extract, ty, {std::move(agg), Value::constInt(index)});
}

void IRBuilder::br(const std::string &label, const std::vector<Value> &args)
{
    Instr instr;
    instr.op = Opcode::Br;
    instr.type = voidTy();
    instr.labels.push_back(label);
    instr.brArgs.push_back(args);
    append(std::move(instr));
}

void IRBuilder::br(const BasicBlock &dst, const std::vector<Value> &args)
{
    assert(args.size() == dst.params.size() &&
           "branch argument count must match block parameter count");
    br(dst.label, args);
}

void IRBuilder::cbr(Value cond,
                    const std::string &t,
                    const std::vector<Value> &targs,
                    const std::string &f,
                    const std::vector<Value> &fargs)
{
    Instr instr;
    instr.op = Opcode::CBr;
    instr.type = voidTy();
    instr.operands.push_back(std::move(cond));
    instr.labels = {t, f};
    instr.brArgs = {targs, fargs};
    append(std::move(instr));
}

void IRBuilder::switchI32(Value scrutinee,
                          const std::string &defaultLabel,
                          const std::vector<long long> &caseValues,
                          const std::vector<std::string> &caseLabels,
                          const std::vector<std::vector<Value>> &caseArgs)
{
    assert(caseValues.size() == caseLabels.size() && caseLabels.size() == caseArgs.size());
    Instr instr;
    instr.op = Opcode::SwitchI32;
    instr.type = voidTy();
    instr.operands.push_back(std::move(scrutinee));
    instr.labels.push_back(defaultLabel);
    instr.brArgs.emplace_back();
    for (size_t i = 0; i < caseValues.size(); ++i)
    {
        instr.operands.push_back(Value::constInt(caseValues[i]));
        instr.labels.push_back(caseLabels[i]);
        instr.brArgs.push_back(caseArgs[i]);
    }
    append(std::move(instr));
}

void IRBuilder::indirectBr(Value address, const std::vector<std::string> &targets)
{
    Instr instr;
    instr.op = Opcode::IndirectBr;
    instr.type = voidTy();
    instr.operands.push_back(std::move(address));
    instr.labels = targets;
    instr.brArgs.assign(targets.size(), {});
    append(std::move(instr));
}

void IRBuilder::ret(const std::vector<Value> &values)
{
    Instr instr;
    instr.op = Opcode::Ret;
    instr.type = voidTy();
    instr.operands = values;
    append(std::move(instr));
}

void IRBuilder::unreachable()
{
    Instr instr;
    instr.op = Opcode::Unreachable;
    instr.type = voidTy();
    append(std::move(instr));
}

//===----------------------------------------------------------------------===//
// Object-model instructions
//===----------------------------------------------------------------------===//

Value IRBuilder::objNew(ClassId cls, const std::vector<Value> &fieldValues)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ObjNew;
    instr.type = ptrTy();
    instr.classId = cls;
    instr.operands = fieldValues;
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

Value IRBuilder::objGet(Type ty, Value obj, ClassId cls, const std::string &field)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ObjGet;
    instr.type = ty;
    instr.classId = cls;
    instr.operands = {std::move(obj)};
    instr.fields = {field};
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

void IRBuilder::objSet(Value obj, ClassId cls, const std::string &field, Value value)
{
    Instr instr;
    instr.op = Opcode::ObjSet;
    instr.type = voidTy();
    instr.classId = cls;
    instr.operands = {std::move(obj), std::move(value)};
    instr.fields = {field};
    append(std::move(instr));
}

Value IRBuilder::objWith(Value src,
                         ClassId cls,
                         const std::vector<std::string> &fields,
                         const std::vector<Value> &values)
{
    assert(fields.size() == values.size());
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ObjWith;
    instr.type = ptrTy();
    instr.classId = cls;
    instr.operands.push_back(std::move(src));
    instr.operands.insert(instr.operands.end(), values.begin(), values.end());
    instr.fields = fields;
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

Value IRBuilder::arrNew(ClassId cls, const std::vector<Value> &elements)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ArrNew;
    instr.type = ptrTy();
    instr.classId = cls;
    instr.operands = elements;
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

Value IRBuilder::arrAlloc(ClassId cls, Value count)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ArrAlloc;
    instr.type = ptrTy();
    instr.classId = cls;
    instr.operands = {std::move(count)};
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

Value IRBuilder::arrClone(ClassId cls, Value src)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ArrClone;
    instr.type = ptrTy();
    instr.classId = cls;
    instr.operands = {std::move(src)};
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

Value IRBuilder::arrGet(Type ty, Value arr, ClassId cls, Value index, const std::string &slot)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ArrGet;
    instr.type = ty;
    instr.classId = cls;
    instr.operands = {std::move(arr), std::move(index)};
    if (!slot.empty())
        instr.fields = {slot};
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

void IRBuilder::arrSet(Value arr, ClassId cls, Value index, Value value, const std::string &slot)
{
    Instr instr;
    instr.op = Opcode::ArrSet;
    instr.type = voidTy();
    instr.classId = cls;
    instr.operands = {std::move(arr), std::move(index), std::move(value)};
    if (!slot.empty())
        instr.fields = {slot};
    append(std::move(instr));
}

Value IRBuilder::arrSize(Value arr, ClassId cls)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ArrSize;
    instr.type = i64Ty();
    instr.classId = cls;
    instr.operands = {std::move(arr)};
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

Value IRBuilder::arrHash(Value arr, ClassId cls)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::ArrHash;
    instr.type = i64Ty();
    instr.classId = cls;
    instr.operands = {std::move(arr)};
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

std::optional<Value> IRBuilder::vcall(const std::string &method,
                                      Type ret,
                                      ClassId staticClass,
                                      const std::vector<Value> &args)
{
    assert(!args.empty() && "virtual call requires a receiver");
    Instr instr;
    instr.op = Opcode::VCall;
    instr.type = ret;
    instr.callee = method;
    instr.classId = staticClass;
    instr.operands = args;
    std::optional<Value> result;
    if (ret.kind != Type::Kind::Void)
    {
        instr.result = reserveTempId();
        result = Value::temp(*instr.result);
    }
    append(std::move(instr));
    return result;
}

std::optional<Value> IRBuilder::vinvoke(const std::string &method,
                                        Type ret,
                                        ClassId staticClass,
                                        const std::vector<Value> &args,
                                        const std::string &normal,
                                        const std::string &unwind)
{
    assert(!args.empty() && "virtual call requires a receiver");
    Instr instr;
    instr.op = Opcode::VInvoke;
    instr.type = ret;
    instr.callee = method;
    instr.classId = staticClass;
    instr.operands = args;
    instr.labels = {normal, unwind};
    instr.brArgs = {{}, {}};
    std::optional<Value> result;
    if (ret.kind != Type::Kind::Void)
    {
        instr.result = reserveTempId();
        result = Value::temp(*instr.result);
    }
    append(std::move(instr));
    return result;
}

void IRBuilder::typeSwitch(Value value, ClassId staticClass, const std::vector<TypeCase> &cases)
{
    Instr instr;
    instr.op = Opcode::TypeSwitch;
    instr.type = voidTy();
    instr.classId = staticClass;
    instr.operands = {std::move(value)};
    for (const auto &c : cases)
    {
        instr.caseClasses.push_back(c.classId);
        instr.labels.push_back(c.label);
        instr.brArgs.push_back(c.args);
    }
    append(std::move(instr));
}

Value IRBuilder::freeze(Value value, ClassId cls)
{
    Instr instr;
    instr.result = reserveTempId();
    instr.op = Opcode::Freeze;
    instr.type = ptrTy();
    instr.classId = cls;
    instr.operands = {std::move(value)};
    unsigned id = *instr.result;
    append(std::move(instr));
    return Value::temp(id);
}

} // namespace kiln::build
