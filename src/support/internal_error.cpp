//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/internal_error.cpp
// Purpose: Implements InternalError construction and the fatal() helper.
//
//===----------------------------------------------------------------------===//

#include "support/internal_error.hpp"

#include "support/diag_expected.hpp"

#include <sstream>

namespace kiln::support
{
namespace
{

std::string formatDiag(const Diagnostic &diag)
{
    std::ostringstream os;
    printDiag(diag, os);
    std::string text = os.str();
    if (!text.empty() && text.back() == '\n')
        text.pop_back();
    return text;
}

} // namespace

InternalError::InternalError(Diagnostic diag) : std::logic_error(formatDiag(diag)), diag_(std::move(diag))
{
}

void fatal(SourceLoc loc, const std::string &message)
{
    throw InternalError(makeError(loc, "internal compiler error: " + message));
}

} // namespace kiln::support
