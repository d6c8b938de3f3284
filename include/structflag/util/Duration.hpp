#pragma once
/// @file Duration.hpp
/// @brief Duration type and its canonical text form ("1h30m0s", "1.5s", "300ms")

#include <chrono>
#include <string>
#include <system_error>

namespace StructFlag {

/// @brief Duration field type. Signed 64-bit nanosecond count.
using Duration = std::chrono::nanoseconds;

namespace util {

/// @brief Format a duration in canonical form
/// @details Values under one second use the largest of ns, µs, ms that keeps the integer
///          part non-zero, with trailing fraction zeros trimmed ("1.5ms", "300ns").
///          Larger values are written as [Nh][Nm]N[.frac]s ("1m0s", "1h30m0s", "2.5s").
///          Zero is "0s".
/// @param d Duration to format
/// @return Canonical duration string
std::string formatDuration(Duration d);

/// @brief Parse a duration string
/// @details Accepts an optional sign followed by one or more decimal numbers, each with an
///          optional fraction and a unit suffix (ns, us, µs, μs, ms, s, m, h).
///          e.g. "5s", "1h30m", "-1.5h", "300ms". A bare "0" is accepted.
/// @param s Input string
/// @param out Parsed duration (unchanged on failure)
/// @param ec Error code. invalid_argument on syntax error, result_out_of_range on overflow
/// @return true on success
bool parseDuration(const std::string& s, Duration& out, std::error_code& ec);

} // namespace util
} // namespace StructFlag
