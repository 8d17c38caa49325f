//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/alignment.hpp
// Purpose: Provides alignment utilities for byte and bit offset calculations.
//
// Object and array layouts are expressed in bits by the layout oracle while
// allocation sizes and memory operations work in bytes; these helpers keep the
// rounding rules in one place.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace kiln::support
{

/// @brief Round a value up to the next multiple of alignment.
/// @details Alignment must be a power of two for correct results.
template <typename T> [[nodiscard]] constexpr T alignUp(T n, T alignment) noexcept
{
    static_assert(std::is_integral_v<T>, "alignUp requires an integral type");
    return (n + alignment - 1) & ~(alignment - 1);
}

} // namespace kiln::support
