#pragma once

#include <optional>
#include <string>

namespace gradepace::io {

// Parse an ISO-8601 date-time ("2024-05-01T06:30:00Z", "...T06:30:00.250+02:00").
// A missing zone designator is read as UTC. Returns seconds since the Unix epoch,
// or nullopt when the text is not a valid date-time.
std::optional<double> ParseIso8601(const std::string& text);

// "2024-05-01T06:30:00Z" (whole seconds, UTC).
std::string FormatIso8601(double epoch_s);

} // namespace gradepace::io
