#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace quarry {

/// Points in time handled by the date tools: milliseconds since the Unix epoch, in UTC.
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// Time granularity of an indexed date.
///
/// Dates should not be indexed with a finer resolution than needed: the coarser the
/// resolution, the fewer distinct terms a range or prefix query has to visit.
enum class Resolution { Year, Month, Day, Hour, Minute, Second, Millisecond };

/// Returns the lowercase name of `resolution`, e.g., `"day"`.
///
/// \throws InvalidFormat  if `resolution` is not one of the enumerators
[[nodiscard]] auto to_string(Resolution resolution) -> std::string_view;

/// Parses a resolution name as returned by `to_string`.
///
/// \throws InvalidFormat  if `name` is not a known resolution
[[nodiscard]] auto parse_resolution(std::string_view name) -> Resolution;

/// Limits the precision of `time` to `resolution`: finer fields are reset, month and day
/// to 1 and time fields to 0. For example, `2004-09-21 13:50:11` becomes `2004-09-01 00:00:00`
/// at `Resolution::Month`.
[[nodiscard]] auto round(Timestamp time, Resolution resolution) -> Timestamp;

/// Same as above for a time given in milliseconds since the epoch.
[[nodiscard]] auto round(std::int64_t millis, Resolution resolution) -> std::int64_t;

/// Converts a date to a string such that lexicographic order is chronological order.
///
/// The result has the format `yyyyMMddHHmmssSSS`, or a prefix of it depending on
/// `resolution`; e.g., `yyyyMMdd` for `Resolution::Day`.
///
/// \throws InvalidFormat  if the year is outside of `[0, 9999]`
[[nodiscard]] auto date_to_string(Timestamp time, Resolution resolution) -> std::string;

/// Same as `date_to_string` for a time given in milliseconds since the epoch.
[[nodiscard]] auto time_to_string(std::int64_t millis, Resolution resolution) -> std::string;

/// Parses a string produced by `date_to_string` back to a date.
///
/// \throws InvalidFormat  if the length does not match any resolution, if any character is not
///                        a digit, or if a field is out of range
[[nodiscard]] auto string_to_date(std::string_view value) -> Timestamp;

/// Same as `string_to_date` but returns milliseconds since the epoch.
[[nodiscard]] auto string_to_time(std::string_view value) -> std::int64_t;

}  // namespace quarry
