#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "meta.hpp"
#include "value.hpp"

namespace marshal
{

//=============================================================================
// Scalar coercions used by the primitive handlers
//=============================================================================

/// Strings matching one of these (ignoring case) load as true
inline constexpr std::array<std::string_view, 6> kTruthyTokens { "true", "t", "yes", "y", "on", "1" };

/**
 * @brief Boolean coercion
 *
 * Booleans load as is, strings are matched case-insensitively against
 * kTruthyTokens, numbers are true iff equal to 1. Any other input is false.
 */
bool loadBool(Value const& value);

/**
 * @brief Integer coercion
 *
 * Accepts integers, floats and numeric strings. A fractional remainder is
 * rounded half to even, or rejected with FractionalIntegers::reject.
 *
 * @throws Error ErrorKind::typeMismatch
 */
std::int64_t loadInteger(Value const& value, FractionalIntegers policy = FractionalIntegers::round);

/// @throws Error ErrorKind::typeMismatch
double loadFloat(Value const& value);

/// Strings as is, other scalars as their canonical text, null as ""
std::string loadString(Value const& value);

/// Base64 text or a sequence of integers in 0..255
std::vector<std::byte> loadBytes(Value const& value);

std::string encodeBase64(std::span<std::byte const> bytes);
std::optional<std::vector<std::byte>> decodeBase64(std::string_view text);

//=============================================================================
// Date and time
//=============================================================================

/// ISO 8601 forms tried before any custom pattern
inline constexpr std::array<std::string_view, 5> kIsoDateTimeFormats
{
    "%Y-%m-%dT%H:%M:%S%Ez", "%Y-%m-%dT%H:%M:%SZ", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"
};

inline constexpr std::string_view kIsoDateFormat = "%Y-%m-%d";

/**
 * @brief Loads an instant from ISO text, custom patterns or a Unix timestamp
 *
 * @throws Error ErrorKind::patternParse naming every format tried,
 *         ErrorKind::typeMismatch for non-string non-numeric input
 */
Instant loadDateTime(Value const& value, std::span<std::string const> patterns = {});

/// Same as loadDateTime() for calendar dates
std::chrono::year_month_day loadDate(Value const& value, std::span<std::string const> patterns = {});

/**
 * @brief Loads an ISO 8601 time of day "HH:MM[:SS[.ffffff]]", optionally suffixed by 'Z'
 *
 * @return the time since midnight
 * @throws Error ErrorKind::patternParse for malformed or out of range text,
 *         ErrorKind::typeMismatch for anything but a string
 */
std::chrono::microseconds loadTime(Value const& value);

/// Seconds as a number, a numeric string or "[-]HH:MM:SS[.ffffff]"
std::chrono::duration<double> loadDuration(Value const& value);

/// "YYYY-MM-DDTHH:MM:SS[.ffffff]Z"
std::string formatDateTime(Instant instant);

/// "YYYY-MM-DD"
std::string formatDate(std::chrono::year_month_day date);

Value dumpDateTime(Instant instant, DateTimeOutput output);
Value dumpDate(std::chrono::year_month_day date, DateTimeOutput output);

/// "HH:MM:SS" or "HH:MM:SS.ffffff"; throws Error outside of [00:00, 24:00)
Value dumpTime(std::chrono::microseconds sinceMidnight);
Value dumpDuration(std::chrono::duration<double> seconds);

} // namespace marshal
