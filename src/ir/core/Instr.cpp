//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements accessors for the switch.i32 operand layout: operand 0 is the
// scrutinee and operands 1..N the case values; label 0 is the default
// destination and labels 1..N the case destinations.
//
//===----------------------------------------------------------------------===//

#include "ir/core/Instr.hpp"

#include <cassert>

namespace kiln::core
{

const Value &switchScrutinee(const Instr &instr)
{
    assert(instr.op == Opcode::SwitchI32 && !instr.operands.empty());
    return instr.operands.front();
}

const std::string &switchDefaultLabel(const Instr &instr)
{
    assert(instr.op == Opcode::SwitchI32 && !instr.labels.empty());
    return instr.labels.front();
}

size_t switchCaseCount(const Instr &instr)
{
    assert(instr.op == Opcode::SwitchI32);
    return instr.operands.empty() ? 0 : instr.operands.size() - 1;
}

const Value &switchCaseValue(const Instr &instr, size_t index)
{
    assert(index < switchCaseCount(instr));
    return instr.operands[index + 1];
}

const std::string &switchCaseLabel(const Instr &instr, size_t index)
{
    assert(index + 1 < instr.labels.size());
    return instr.labels[index + 1];
}

const std::vector<Value> &switchCaseArgs(const Instr &instr, size_t index)
{
    assert(index + 1 < instr.brArgs.size());
    return instr.brArgs[index + 1];
}

} // namespace kiln::core
