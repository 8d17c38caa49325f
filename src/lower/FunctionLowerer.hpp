//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares FunctionLowerer, which rewrites one function from the
// object-model layer of the IR into loads, stores, allocation calls and
// vtable-based dispatch.
//
// The function is rebuilt block by block: every original block is recreated
// empty (same label, same parameter ids) and its instructions are replayed
// through lowerInstr, which either re-emits an instruction unchanged or emits
// a replacement sequence. Replacement sequences define the original result id
// on exactly one instruction where a value still exists; results that become
// another value (freeze, zero substitution) are recorded in a replacement map
// that is applied to every operand once the whole function has been rebuilt.
//
// Lowering a non-terminator into control flow splits the current block; the
// remaining instructions continue in the new block.
//
// The implementation is split by concern:
//   FunctionLowerer.cpp  - driver loop, shared memory helpers
//   Lower_Alloc.cpp      - objects, arrays, record update
//   Lower_Dispatch.cpp   - virtual calls, type switches, unreachable traps
//   Lower_Freeze.cpp     - deep-freeze flag updates
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/build/IRBuilder.hpp"
#include "ir/core/Function.hpp"
#include "ir/core/Instr.hpp"
#include "lower/Layout.hpp"
#include "lower/LoweringContext.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kiln::lower
{

class FunctionLowerer
{
  public:
    FunctionLowerer(LoweringContext &ctx, core::Function &fn);

    /// @brief Lower every instruction of the function in place.
    void run();

    /// @brief Number of call sites and type switches lowered to traps.
    [[nodiscard]] unsigned unreachableSites() const
    {
        return unreachableSites_;
    }

  private:
    LoweringContext &ctx_;
    core::Function &fn_;
    build::IRBuilder b_;
    unsigned ptrBytes_;

    /// Result id -> value that replaces it.
    std::unordered_map<unsigned, core::Value> replacements_;

    /// Results of calls proven never to return.
    std::unordered_set<unsigned> unreachable_;

    /// Parameter types of every original block, by label.
    std::unordered_map<std::string, std::vector<core::Type>> blockParamTypes_;

    unsigned unreachableSites_ = 0;

    void lowerInstr(core::Instr in);
    void resolveOperands(core::Instr &in) const;
    bool readsUnreachable(core::Instr &in) const;
    void dropUnreachableUse(const core::Instr &in);

    // Shared memory helpers (FunctionLowerer.cpp).
    const core::ClassDecl &referenceClass(core::ClassId id,
                                          support::SourceLoc loc,
                                          const char *what) const;
    void checkFieldTypes(const core::ClassDecl &cls, support::SourceLoc loc) const;
    std::vector<LayoutSlot> checkedLayout(const core::ClassDecl &cls, support::SourceLoc loc) const;
    const LayoutSlot &slotFor(const core::ClassDecl &cls,
                              const std::vector<LayoutSlot> &slots,
                              const std::string &field,
                              support::SourceLoc loc) const;
    core::Value emitAlloc(core::Value bytes, bool zero);
    core::Value vtableAddress(const core::ClassDecl &cls);
    void emitGepInto(unsigned result, core::Value base, core::Value offset);
    void emitLoadInto(unsigned result,
                      core::Type type,
                      core::Value ptr,
                      core::Value offset,
                      core::MemAttrs attrs);
    void storeAtBit(core::Type type,
                    core::Value ptr,
                    core::Value byteOffset,
                    uint32_t bitOffset,
                    core::Value value,
                    support::SourceLoc loc);
    core::MemAttrs bitAttrs(core::Type type, uint32_t bitOffset, support::SourceLoc loc) const;
    core::Value addOffset(core::Value base, int64_t constant);
    std::string currentLabel();
    void continueIn(const std::string &label, support::SourceLoc loc);

    // Allocation (Lower_Alloc.cpp).
    uint32_t objectFieldBytes(const std::vector<LayoutSlot> &slots) const;
    void lowerObjNew(const core::Instr &in);
    void lowerObjGet(const core::Instr &in);
    void lowerObjSet(const core::Instr &in);
    void lowerObjWith(const core::Instr &in);
    core::Value objectSizeFor(const core::ClassDecl &cls, core::Value obj, support::SourceLoc loc);
    struct ArrayAllocation
    {
        core::Value ptr;
        core::Value contentBytes;
    };
    ArrayAllocation emitArrayAlloc(const core::ClassDecl &cls,
                                   const ArraySlotInfo &info,
                                   core::Value count,
                                   bool zeroFill,
                                   unsigned result,
                                   support::SourceLoc loc);
    void emitTailZero(core::Value ptr, core::Value contentBytes, core::Value paddedBytes);
    const ArraySlotInfo &arrayInfo(const core::ClassDecl &cls, support::SourceLoc loc);
    size_t tupleSlot(const core::ClassDecl &cls, const core::Instr &in) const;
    core::Value elementOffset(core::Value index, uint32_t elemBytes, uint32_t tupleByte);
    void lowerArrNew(const core::Instr &in);
    void lowerArrAlloc(const core::Instr &in);
    void lowerArrClone(const core::Instr &in);
    void lowerArrGet(const core::Instr &in);
    void lowerArrSet(const core::Instr &in);
    void lowerArrHeaderLoad(const core::Instr &in, int64_t offset);

    // Dispatch (Lower_Dispatch.cpp).
    core::Value loadVTable(core::Value obj);
    void emitUnreachableTrap(const std::string &message,
                             core::Value subject,
                             support::SourceLoc loc);
    void lowerVirtualCall(const core::Instr &in);
    void lowerTypeSwitch(const core::Instr &in);
    void lowerExtract(core::Instr in);

    // Freeze (Lower_Freeze.cpp).
    void lowerFreeze(const core::Instr &in);

    std::unordered_map<core::ClassId, ArraySlotInfo> arrayInfoCache_;

    /// Element counts of arrays built in this function with a constant length.
    std::unordered_map<unsigned, int64_t> knownLengths_;
};

/// @brief Zero value of scalar type @p type; fatal at @p loc for other types.
core::Value zeroValue(core::Type type, support::SourceLoc loc);

} // namespace kiln::lower
