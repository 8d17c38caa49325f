//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: the Expected<void> specialisation, severity-to-string mapping, and
// the canonical diagnostic printer.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace kiln::support
{

Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{

const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

Diag makeNote(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Note, std::move(msg), loc};
}

/// @brief Print @p diag as "<loc>: <severity>: <message>".
/// @details The location prefix is omitted for diagnostics without a file.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.loc.isValid())
        os << toString(diag.loc) << ": ";
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace kiln::support
