//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the IRBuilder class, which provides the API for
// constructing IR modules programmatically. Frontends (and tests) use it to
// author object-model IR; the lowering pass uses the same builder to emit the
// low-level replacement sequences.
//
// The IRBuilder manages the insertion point and tracks SSA temporaries.
// The insertion point is remembered as a block index rather than a pointer so
// that creating further blocks (which may reallocate Function::blocks) never
// invalidates it.
//
// Typical Usage Pattern:
//   Module m;
//   IRBuilder b(m);
//   auto &fn = b.startFunction("main", Type(Type::Kind::I64), {});
//   b.setInsertPoint(b.createBlock(fn, "entry"));
//   auto obj = b.objNew(pointId, {Value::constInt(1), Value::constInt(2)});
//   b.ret({b.objGet(Type(Type::Kind::I64), obj, pointId, "x")});
//
// The IRBuilder does NOT own the Module it operates on.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/BasicBlock.hpp"
#include "ir/core/Function.hpp"
#include "ir/core/Module.hpp"
#include "ir/core/Opcode.hpp"
#include "ir/core/Value.hpp"
#include "support/source_location.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln::build
{

/// @brief One arm of a type switch: instances of @c classId continue at
///        @c label with block arguments @c args.
struct TypeCase
{
    core::ClassId classId = core::kNoClass;
    std::string label;
    std::vector<core::Value> args;
};

/// @brief Helper to construct IR modules and enforce block termination.
class IRBuilder
{
  public:
    explicit IRBuilder(core::Module &m);

    //===------------------------------------------------------------------===//
    // Module level
    //===------------------------------------------------------------------===//

    core::Extern &addExtern(const std::string &name,
                            core::Type ret,
                            const std::vector<core::Type> &params);

    /// @brief Declare @p name unless an extern of that name already exists.
    void ensureExtern(const std::string &name, core::Type ret, const std::vector<core::Type> &params);

    core::Global &addGlobal(const std::string &name, core::Type type, const std::string &init = "");

    core::Global &addGlobalStr(const std::string &name, const std::string &value);

    /// @brief Append @p decl to the class table, assigning the next class id.
    core::ClassId addClass(core::ClassDecl decl);

    /// @brief Append a constant object, assigning the next constant id.
    unsigned addConstant(core::ClassId cls, std::vector<core::ConstField> fields);

    //===------------------------------------------------------------------===//
    // Functions and blocks
    //===------------------------------------------------------------------===//

    core::Function &startFunction(const std::string &name,
                                  core::Type ret,
                                  const std::vector<core::Param> &params);

    /// @brief Continue emitting into an existing function.
    /// @param nextTemp First temporary id that is free in @p fn.
    void resumeFunction(core::Function &fn, unsigned nextTemp);

    core::BasicBlock &createBlock(core::Function &fn,
                                  const std::string &label,
                                  const std::vector<core::Param> &params = {});

    /// @brief Create a block in the active function whose label starts with
    ///        @p hint and is unique within the function.
    core::BasicBlock &createUniqueBlock(const std::string &hint,
                                        const std::vector<core::Param> &params = {});

    /// @brief Produce a label starting with @p hint that no block uses yet.
    std::string uniqueLabel(const std::string &hint);

    core::Value blockParam(const core::BasicBlock &bb, unsigned idx) const;

    void setInsertPoint(core::BasicBlock &bb);

    /// @brief Block receiving emitted instructions.
    core::BasicBlock &insertBlock();

    [[nodiscard]] bool hasInsertPoint() const
    {
        return curFunc != nullptr && curBlock.has_value();
    }

    core::Function &function();

    unsigned reserveTempId();

    /// @brief Source location attached to every subsequently emitted instruction.
    void setLoc(support::SourceLoc loc)
    {
        curLoc = loc;
    }

    /// @brief Append a fully formed instruction to the insertion block.
    core::Instr &append(core::Instr instr);

    //===------------------------------------------------------------------===//
    // Low-level instructions
    //===------------------------------------------------------------------===//

    core::Value binary(core::Opcode op, core::Type ty, core::Value lhs, core::Value rhs);
    core::Value add(core::Type ty, core::Value lhs, core::Value rhs);
    core::Value mul(core::Type ty, core::Value lhs, core::Value rhs);
    core::Value andBits(core::Type ty, core::Value lhs, core::Value rhs);
    core::Value orBits(core::Type ty, core::Value lhs, core::Value rhs);
    core::Value icmpNe(core::Value lhs, core::Value rhs);
    core::Value zext(core::Type to, core::Value v);
    core::Value trunc(core::Type to, core::Value v);
    core::Value gep(core::Value base, core::Value offset);
    core::Value load(core::Type ty, core::Value ptr, core::Value offset, core::MemAttrs attrs = {});
    void store(core::Type ty,
               core::Value ptr,
               core::Value offset,
               core::Value value,
               core::MemAttrs attrs = {});
    void memcpy(core::Value dst, core::Value src, core::Value bytes);

    /// @brief Emit a direct call; returns the result when @p ret is not void.
    std::optional<core::Value> call(const std::string &callee,
                                    core::Type ret,
                                    const std::vector<core::Value> &args);

    /// @brief Emit an indirect call through @p target.
    /// @param resultId Temporary to define, or disengaged for void results.
    void callIndirect(core::Type ret,
                      core::Value target,
                      const std::vector<core::Value> &args,
                      std::optional<unsigned> resultId);

    void invokeIndirect(core::Type ret,
                        core::Value target,
                        const std::vector<core::Value> &args,
                        std::optional<unsigned> resultId,
                        const std::string &normal,
                        const std::string &unwind);

    core::Value extract(core::Type ty, core::Value agg, unsigned index);

    void br(const std::string &label, const std::vector<core::Value> &args = {});
    void br(const core::BasicBlock &dst, const std::vector<core::Value> &args = {});
    void cbr(core::Value cond,
             const std::string &t,
             const std::vector<core::Value> &targs,
             const std::string &f,
             const std::vector<core::Value> &fargs);

    /// @brief Emit switch.i32; case i jumps to @p caseLabels[i] when the
    ///        scrutinee equals @p caseValues[i].
    void switchI32(core::Value scrutinee,
                   const std::string &defaultLabel,
                   const std::vector<long long> &caseValues,
                   const std::vector<std::string> &caseLabels,
                   const std::vector<std::vector<core::Value>> &caseArgs);

    void indirectBr(core::Value address, const std::vector<std::string> &targets);
    void ret(const std::vector<core::Value> &values = {});
    void unreachable();

    //===------------------------------------------------------------------===//
    // Object-model instructions
    //===------------------------------------------------------------------===//

    core::Value objNew(core::ClassId cls, const std::vector<core::Value> &fieldValues);
    core::Value objGet(core::Type ty, core::Value obj, core::ClassId cls, const std::string &field);
    void objSet(core::Value obj, core::ClassId cls, const std::string &field, core::Value value);
    core::Value objWith(core::Value src,
                        core::ClassId cls,
                        const std::vector<std::string> &fields,
                        const std::vector<core::Value> &values);

    /// @brief Literal array; @p elements holds element tuples flattened.
    core::Value arrNew(core::ClassId cls, const std::vector<core::Value> &elements);
    core::Value arrAlloc(core::ClassId cls, core::Value count);
    core::Value arrClone(core::ClassId cls, core::Value src);

    /// @brief Read tuple slot @p slot (empty selects the only slot) of element @p index.
    core::Value arrGet(core::Type ty,
                       core::Value arr,
                       core::ClassId cls,
                       core::Value index,
                       const std::string &slot = "");
    void arrSet(core::Value arr,
                core::ClassId cls,
                core::Value index,
                core::Value value,
                const std::string &slot = "");
    core::Value arrSize(core::Value arr, core::ClassId cls);
    core::Value arrHash(core::Value arr, core::ClassId cls);

    /// @brief Virtual call of @p method; @p args[0] is the receiver whose
    ///        static class is @p staticClass.
    std::optional<core::Value> vcall(const std::string &method,
                                     core::Type ret,
                                     core::ClassId staticClass,
                                     const std::vector<core::Value> &args);

    std::optional<core::Value> vinvoke(const std::string &method,
                                       core::Type ret,
                                       core::ClassId staticClass,
                                       const std::vector<core::Value> &args,
                                       const std::string &normal,
                                       const std::string &unwind);

    void typeSwitch(core::Value value, core::ClassId staticClass, const std::vector<TypeCase> &cases);

    /// @brief Deep-freeze @p value of static class @p cls; yields the same reference.
    core::Value freeze(core::Value value, core::ClassId cls);

  private:
    core::Module &mod;
    core::Function *curFunc{nullptr};
    std::optional<size_t> curBlock;
    unsigned nextTemp{0};
    support::SourceLoc curLoc{};
    std::unordered_map<std::string, unsigned> labelCounters;

    core::Value emitValue(core::Opcode op, core::Type ty, std::vector<core::Value> operands);
};

} // namespace kiln::build
