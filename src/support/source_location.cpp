//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.cpp
// Purpose: Implements validity checks and formatting for SourceLoc.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace kiln::support
{

/// @brief Report whether this location references a tracked file.
/// @details File identifier zero is reserved for "unknown"; every other
///          identifier is assigned by the frontend that produced the IR.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

/// @brief Format a location for diagnostics.
/// @details Unknown locations print as "<unknown>". Missing columns or lines
///          are omitted rather than printed as zero.
std::string toString(const SourceLoc &loc)
{
    if (!loc.isValid())
        return "<unknown>";
    std::string out = "file#" + std::to_string(loc.file_id);
    if (loc.hasLine())
    {
        out += ':' + std::to_string(loc.line);
        if (loc.hasColumn())
            out += ':' + std::to_string(loc.column);
    }
    return out;
}

} // namespace kiln::support
