// File: src/lower/RuntimeNames.hpp
// Purpose: Names and signatures of runtime entry points and symbols referenced
//          by lowered code.
// Key invariants: Names are stable; the VM and native runtimes implement them.
// Ownership/Lifetime: Compile-time constants only.
// Links: vm/Machine.cpp
#pragma once

#include "ir/core/Class.hpp"

#include <cstdint>
#include <string>

namespace kiln::lower
{

/// @brief `ptr kiln_alloc(i64 bytes, i1 zero)`.
/// Returns an 8-byte aligned block of at least @c bytes bytes. Contents are
/// zero when @c zero is true and unspecified otherwise.
inline constexpr const char *kRtAlloc = "kiln_alloc";

/// @brief `void kiln_trap_unreachable(str message, ptr value)`; never returns.
inline constexpr const char *kRtTrapUnreachable = "kiln_trap_unreachable";

/// @brief Bit of the vtable word marking an instance as deeply frozen.
inline constexpr int64_t kFrozenFlag = 1;

/// @brief Bytes of the array header fields preceding the vtable word
///        (element count followed by the reserved/hash word).
inline constexpr int64_t kArrayCountBytes = 8;

/// @brief Symbol of the dispatch table of class @p className.
inline std::string vtableSymbol(const std::string &className)
{
    return "vtable." + className;
}

} // namespace kiln::lower
