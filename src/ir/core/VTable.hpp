//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the materialized form of a class's dispatch table as
// produced by vtable population. Every reference object and array stores the
// address of its class's VTable in the pointer-sized word preceding its
// visible pointer; dispatch code loads values at fixed byte offsets of it.
//
// Layout: bytes [0, 8) hold the class id (i64); request slots follow at
// naturally aligned offsets. Unassigned bytes are zero.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/core/Class.hpp"
#include "ir/core/Type.hpp"
#include "ir/core/Value.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kiln::core
{

/// @brief Byte size of the vtable header holding the class id.
inline constexpr uint32_t kVTableHeaderBytes = 8;

/// @brief One populated vtable slot.
struct VTableSlot
{
    /// Byte offset from the start of the vtable.
    uint32_t offset = 0;
    Type type;
    Value value = Value::null();
};

/// @brief Dispatch table of one class.
struct VTable
{
    ClassId classId = kNoClass;

    /// Symbol naming the table, e.g. "vtable.Point".
    std::string symbol;

    /// Total size in bytes, a multiple of 8.
    uint32_t sizeBytes = kVTableHeaderBytes;

    std::vector<VTableSlot> slots;
};

} // namespace kiln::core
