//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic engine collecting notes, warnings and errors
//          raised while scraping a corpus.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: src/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace scour::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
};

/// @brief Collects diagnostics and prints them in order.
/// @details Extraction never stops on a diagnostic; the engine only records
///          what happened so the driver can decide what to show.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Record a note at @p loc.
    void note(SourceLoc loc, std::string message);

    /// @brief Record a warning at @p loc.
    void warning(SourceLoc loc, std::string message);

    /// @brief Record an error at @p loc.
    void error(SourceLoc loc, std::string message);

    /// @brief Print recorded diagnostics of at least @p minSeverity to @p os.
    /// @param os Output stream.
    /// @param sm Optional source manager for location info.
    /// @param minSeverity Lowest severity that is printed.
    void printAll(std::ostream &os,
                  const SourceManager *sm = nullptr,
                  Severity minSeverity = Severity::Note) const;

    /// @brief All recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of notes reported.
    size_t noteCount() const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t notes_ = 0;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace scour::support
