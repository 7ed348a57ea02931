#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// iso_time.h  –  ISO-8601 UTC Instants
//
// Accepted:  YYYY-MM-DDTHH:MM:SS[.fff][Z|±HH:MM|±HHMM]
//            (a space may replace 'T'; no zone designator means UTC)
// ─────────────────────────────────────────────────────────────────────────────

#include <cstdint>
#include <optional>
#include <string>

namespace regatta {

/// Parse to UTC epoch milliseconds.  Returns nullopt on malformed input.
std::optional<int64_t> parse_iso8601_ms(const std::string& text);

/// Parse to UTC epoch seconds, flooring any fractional second
/// (1969-12-31T23:59:59.5Z is -1).
std::optional<int64_t> parse_iso8601_s(const std::string& text);

/// Epoch milliseconds to whole seconds, rounding toward the past.
int64_t floor_ms_to_s(int64_t t_ms);

/// Format epoch seconds as "YYYY-MM-DDTHH:MM:SSZ".
std::string format_iso8601(int64_t epoch_s);

/// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d);

}  // namespace regatta
