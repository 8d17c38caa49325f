//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Defines metadata describing IR opcode behaviours. The table is generated
// from Opcode.def so that adding an opcode updates the enum, the mnemonic
// table and the behaviour flags in one place.
//
//===----------------------------------------------------------------------===//

#include "ir/core/OpcodeInfo.hpp"

namespace kiln::core
{

const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
#define KILN_OPCODE(NAME, MNEMONIC, RESULT, TERMINATOR, OBJECT_MODEL, SIDE_EFFECTS)                \
    {MNEMONIC, ResultArity::RESULT, TERMINATOR, OBJECT_MODEL, SIDE_EFFECTS},
#include "ir/core/Opcode.def"
#undef KILN_OPCODE
}};

const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<size_t>(op)];
}

bool isTerminator(Opcode op)
{
    return getOpcodeInfo(op).isTerminator;
}

bool isObjectModelOpcode(Opcode op)
{
    return getOpcodeInfo(op).isObjectModel;
}

/// @brief Convert an opcode enumerator to its mnemonic string.
/// @return Mnemonic, or an empty string for out-of-range values.
std::string toString(Opcode op)
{
    const auto idx = static_cast<size_t>(op);
    if (idx < kNumOpcodes)
        return kOpcodeTable[idx].name;
    return {};
}

} // namespace kiln::core
