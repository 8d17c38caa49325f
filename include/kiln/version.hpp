// File: include/kiln/version.hpp
// Purpose: Version identifiers for the Kiln IR and tools.
// Key invariants: KILN_IR_VERSION_STR matches the "kiln" directive written by
//                 the serializer.
// Ownership/Lifetime: Header-only constants.
#pragma once

#define KILN_VERSION_MAJOR 0
#define KILN_VERSION_MINOR 3
#define KILN_VERSION_PATCH 0
#define KILN_VERSION_STR "0.3.0"

#define KILN_IR_VERSION_STR "0.3"

namespace kiln
{

/// @brief Returns the Kiln library version string.
inline const char *version() noexcept
{
    return KILN_VERSION_STR;
}

} // namespace kiln
