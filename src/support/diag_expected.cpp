//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers.  The corpus and profile
// loaders return Expected values; the driver prints failures with printDiag so
// every error reaches the user in the same compiler-style format.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include "support/source_manager.hpp"

namespace scour::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the recorded failure; only valid when hasValue() is false.
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

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a source manager can resolve the file identifier, the message
///          is prefixed with "<path>:<line>:<column>:" following the common
///          compiler diagnostic style.  A trailing newline is always emitted.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.file_id != 0)
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.line != 0)
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                    os << ':' << diag.loc.column;
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace scour::support
