//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lower_Freeze.cpp
/// @brief Deep-freeze markers lowered to updates of the vtable word flag.
///
/// The frozen flag is the low bit of the vtable pointer word. A value that may
/// already be frozen can live in write-protected storage, so its flag is
/// tested before the word is written.
///
//===----------------------------------------------------------------------===//

#include "lower/FunctionLowerer.hpp"

#include "lower/RuntimeNames.hpp"
#include "support/internal_error.hpp"

namespace kiln::lower
{

using namespace kiln::core;
using support::fatal;

void FunctionLowerer::lowerFreeze(const Instr &in)
{
    if (in.operands.size() != 1 || !in.result)
        fatal(in.loc, "malformed freeze");
    const Value &value = in.operands.front();
    const ClassDecl &cls = ctx_.classDecl(in.classId, in.loc);
    if (ctx_.dispatch().classKind(cls.id) != ClassKind::Reference)
        fatal(in.loc, "freeze of value class '" + cls.name + "'");

    replacements_[*in.result] = value;

    const Mutability state = ctx_.dispatch().freezeState(cls.id);
    if (state == Mutability::DeepImmutable)
        return;

    const Type word(Type::Kind::Ptr);
    const Value vtableOffset = Value::constInt(-static_cast<int64_t>(ptrBytes_));
    Value bits = b_.load(word, value, vtableOffset);

    if (state == Mutability::Mutable)
    {
        b_.store(word, value, vtableOffset, b_.orBits(word, bits, Value::constInt(kFrozenFlag)));
        return;
    }

    const std::string here = currentLabel();
    const std::string doFreeze = b_.createUniqueBlock(here + ".freeze").label;
    const std::string cont = b_.createUniqueBlock(here + ".frozen").label;

    Value flag = b_.andBits(word, bits, Value::constInt(kFrozenFlag));
    b_.cbr(b_.icmpNe(flag, Value::constInt(0)), cont, {}, doFreeze, {});

    continueIn(doFreeze, in.loc);
    b_.store(word, value, vtableOffset, b_.orBits(word, bits, Value::constInt(kFrozenFlag)));
    b_.br(cont);

    continueIn(cont, in.loc);
    if (std::ostream *os = ctx_.trace())
        *os << "[lower] @" << fn_.name << ": freeze of " << cls.name << " splits " << here
            << " at " << cont << "\n";
}

} // namespace kiln::lower
