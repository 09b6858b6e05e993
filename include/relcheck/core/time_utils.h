#pragma once

#include <string>
#include <relcheck/core/types.h>

namespace relcheck {

/// ISO-8601 UTC with milliseconds, e.g. "2024-05-01T12:30:00.123Z".
std::string toIsoString(TimePoint tp);

/// Inverse of toIsoString(); fractional seconds and the trailing 'Z' are optional.
Result<TimePoint> parseIsoString(const std::string& text);

/// Local-time compact stamp "YYYYMMDD_HHMMSS" used in generated ids and file names.
std::string toCompactStamp(TimePoint tp);

/// Local-time "YYYY-MM-DD HH:MM:SS" for human-facing output.
std::string toDisplayString(TimePoint tp);

} // namespace relcheck
