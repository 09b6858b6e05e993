#pragma once

#include <relcheck/report/run_summary.h>

#include <ostream>

namespace relcheck::tools {

/// Upper-case outcome tag for console output ("PASS", "NOT FOUND", ...).
const char* outcomeTag(validation::Outcome outcome);

/// One console line for a finished case.
std::string formatCaseLine(const validation::CaseResult& result, std::size_t done,
                           std::size_t total);

/// Totals, per-outcome counts and per-category pass rates; failing cases when @p details.
void printSummary(std::ostream& out, const report::RunSummary& summary, bool details);

} // namespace relcheck::tools
