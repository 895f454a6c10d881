/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates messages emitted while the corpus is scanned and
 *     keeps track of severity counts.  Diagnostics are stored until callers
 *     explicitly print or inspect them.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace scour::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Note:
            ++notes_;
            break;
        case Severity::Warning:
            ++warnings_;
            break;
        case Severity::Error:
            ++errors_;
            break;
    }
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::note(SourceLoc loc, std::string message)
{
    report(Diagnostic{Severity::Note, std::move(message), loc});
}

void DiagnosticEngine::warning(SourceLoc loc, std::string message)
{
    report(Diagnostic{Severity::Warning, std::move(message), loc});
}

void DiagnosticEngine::error(SourceLoc loc, std::string message)
{
    report(Diagnostic{Severity::Error, std::move(message), loc});
}

/**
 * @brief Writes stored diagnostics to the provided output stream.
 *
 * Diagnostics below @p minSeverity are skipped, which lets the driver hide the
 * per-record notes unless tracing is requested.  Formatting is delegated to
 * `printDiag`.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 * @param minSeverity Lowest severity that is printed.
 */
void DiagnosticEngine::printAll(std::ostream &os,
                                const SourceManager *sm,
                                Severity minSeverity) const
{
    for (const auto &d : diags_)
    {
        if (static_cast<int>(d.severity) < static_cast<int>(minSeverity))
            continue;
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::noteCount() const
{
    return notes_;
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace scour::support
