#include "coercion.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <sstream>
#include "errors.hpp"

namespace marshal
{
namespace
{
std::string_view trim(std::string_view s)
{
    auto const isSpace = [] (char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while ((! s.empty()) && isSpace(s.front()))
        s.remove_prefix(1);

    while ((! s.empty()) && isSpace(s.back()))
        s.remove_suffix(1);

    return s;
}

template <typename Number>
std::optional<Number> parseNumber(std::string_view text)
{
    text = trim(text);

    if ((! text.empty()) && text.front() == '+')
        text.remove_prefix(1);

    Number result {};
    auto const* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, result);

    if (text.empty() || ec != std::errc() || ptr != end)
        return std::nullopt;

    return result;
}

std::int64_t integerFromDouble(double d, FractionalIntegers policy, Value const& original)
{
    if (! std::isfinite(d))
        throw typeMismatch("integer", original);

    if (d != std::trunc(d))
    {
        if (policy == FractionalIntegers::reject)
            throw Error(ErrorKind::typeMismatch, std::format("expected integer, got {} with a fractional part", original.repr()), original);

        d = std::nearbyint(d);
    }

    if (d < static_cast<double>(std::numeric_limits<std::int64_t>::min())
        || d >= static_cast<double>(std::numeric_limits<std::int64_t>::max()))
        throw Error(ErrorKind::typeMismatch, std::format("integer {} out of range", original.repr()), original);

    return static_cast<std::int64_t>(d);
}
}

//=============================================================================
// Scalar coercions
//=============================================================================
bool loadBool(Value const& value)
{
    switch (value.type())
    {
    case Value::Type::boolean:
        return value.as<bool>();

    case Value::Type::string:
    {
        auto text = std::string(trim(value.as<std::string>()));
        std::transform(text.begin(), text.end(), text.begin(), [] (unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return std::find(kTruthyTokens.begin(), kTruthyTokens.end(), text) != kTruthyTokens.end();
    }

    case Value::Type::integer:
        return value.as<std::int64_t>() == 1;

    case Value::Type::floating:
        return value.as<double>() == 1.0;

    default:
        return false;
    }
}

std::int64_t loadInteger(Value const& value, FractionalIntegers policy)
{
    switch (value.type())
    {
    case Value::Type::integer:
        return value.as<std::int64_t>();

    case Value::Type::floating:
        return integerFromDouble(value.as<double>(), policy, value);

    case Value::Type::string:
    {
        auto const& text = value.as<std::string>();

        if (auto integer = parseNumber<std::int64_t>(text))
            return *integer;

        if (auto floating = parseNumber<double>(text))
            return integerFromDouble(*floating, policy, value);

        break;
    }

    default:
        break;
    }

    throw typeMismatch("integer", value);
}

double loadFloat(Value const& value)
{
    switch (value.type())
    {
    case Value::Type::integer:
    case Value::Type::floating:
        return value.toDouble();

    case Value::Type::string:
        if (auto floating = parseNumber<double>(value.as<std::string>()))
            return *floating;

        break;

    default:
        break;
    }

    throw typeMismatch("float", value);
}

std::string loadString(Value const& value)
{
    switch (value.type())
    {
    case Value::Type::string:
        return value.as<std::string>();

    case Value::Type::null:
        return {};

    case Value::Type::boolean:
    case Value::Type::integer:
    case Value::Type::floating:
        return value.toText();

    default:
        throw typeMismatch("string", value);
    }
}

std::vector<std::byte> loadBytes(Value const& value)
{
    if (auto const* text = value.getIf<std::string>())
    {
        if (auto decoded = decodeBase64(*text))
            return std::move(*decoded);

        throw Error(ErrorKind::typeMismatch, std::format("expected base64 text, got {}", value.repr()), value);
    }

    if (auto const* seq = value.getIf<Sequence>())
    {
        std::vector<std::byte> result;
        result.reserve(seq->size());

        for (auto const& element : *seq)
        {
            auto const* octet = element.getIf<std::int64_t>();

            if (octet == nullptr || *octet < 0 || *octet > 255)
                throw typeMismatch("sequence of octets", value);

            result.push_back(static_cast<std::byte>(*octet));
        }

        return result;
    }

    throw typeMismatch("bytes", value);
}

namespace
{
constexpr std::string_view kBase64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

std::string encodeBase64(std::span<std::byte const> bytes)
{
    std::string result;
    result.reserve(((bytes.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < bytes.size(); i += 3)
    {
        auto const remaining = bytes.size() - i;
        std::uint32_t chunk = std::to_integer<std::uint32_t>(bytes[i]) << 16;

        if (remaining > 1) chunk |= std::to_integer<std::uint32_t>(bytes[i + 1]) << 8;
        if (remaining > 2) chunk |= std::to_integer<std::uint32_t>(bytes[i + 2]);

        result += kBase64Alphabet[(chunk >> 18) & 0x3f];
        result += kBase64Alphabet[(chunk >> 12) & 0x3f];
        result += remaining > 1 ? kBase64Alphabet[(chunk >> 6) & 0x3f] : '=';
        result += remaining > 2 ? kBase64Alphabet[chunk & 0x3f] : '=';
    }

    return result;
}

std::optional<std::vector<std::byte>> decodeBase64(std::string_view text)
{
    while ((! text.empty()) && text.back() == '=')
        text.remove_suffix(1);

    if (text.size() % 4 == 1)
        return std::nullopt;

    std::vector<std::byte> result;
    result.reserve(text.size() * 3 / 4);

    std::uint32_t buffer = 0;
    auto bits = 0;

    for (auto c : text)
    {
        auto const pos = kBase64Alphabet.find(c);

        if (pos == std::string_view::npos)
            return std::nullopt;

        buffer = (buffer << 6) | static_cast<std::uint32_t>(pos);
        bits += 6;

        if (bits >= 8)
        {
            bits -= 8;
            result.push_back(static_cast<std::byte>((buffer >> bits) & 0xff));
        }
    }

    return result;
}

//=============================================================================
// Date and time
//=============================================================================
namespace
{
template <typename Target>
bool parseWith(std::string const& text, std::string const& format, Target& target)
{
    std::istringstream is(text);
    Target parsed {};
    is >> std::chrono::parse(format, parsed);

    if (is.fail() || is.peek() != std::char_traits<char>::eof())
        return false;

    target = parsed;
    return true;
}

[[noreturn]] void throwPatternError(Value const& value, std::vector<std::string> const& tried)
{
    std::string list;

    for (auto const& format : tried)
        list += (list.empty() ? "" : ", ") + format;

    throw Error(ErrorKind::patternParse, std::format("{} matches none of the formats tried: {}", value.repr(), list), value);
}

Instant instantFromTimestamp(double seconds)
{
    return Instant(std::chrono::microseconds(static_cast<std::int64_t>(std::llround(seconds * 1e6))));
}
}

Instant loadDateTime(Value const& value, std::span<std::string const> patterns)
{
    if (value.isNumber())
        return instantFromTimestamp(value.toDouble());

    auto const* text = value.getIf<std::string>();

    if (text == nullptr)
        throw typeMismatch("date/time", value);

    std::vector<std::string> tried;

    for (auto format : kIsoDateTimeFormats)
    {
        tried.emplace_back(format);
        Instant instant;

        if (format == kIsoDateFormat)
        {
            std::chrono::sys_days day;

            if (parseWith(*text, tried.back(), day))
                return Instant(day);
        }
        else if (parseWith(*text, tried.back(), instant))
        {
            return instant;
        }
    }

    for (auto const& pattern : patterns)
    {
        tried.push_back(pattern);
        Instant instant;

        if (parseWith(*text, pattern, instant))
            return instant;

        std::chrono::sys_days day;

        if (parseWith(*text, pattern, day))
            return Instant(day);
    }

    throwPatternError(value, tried);
}

std::chrono::year_month_day loadDate(Value const& value, std::span<std::string const> patterns)
{
    if (value.isNumber())
        return std::chrono::year_month_day(std::chrono::floor<std::chrono::days>(instantFromTimestamp(value.toDouble())));

    auto const* text = value.getIf<std::string>();

    if (text == nullptr)
        throw typeMismatch("date", value);

    std::vector<std::string> tried { std::string(kIsoDateFormat) };
    std::chrono::year_month_day date;

    if (parseWith(*text, tried.back(), date))
        return date;

    for (auto const& pattern : patterns)
    {
        tried.push_back(pattern);

        if (parseWith(*text, pattern, date))
            return date;
    }

    throwPatternError(value, tried);
}

std::chrono::microseconds loadTime(Value const& value)
{
    auto const* text = value.getIf<std::string>();

    if (text == nullptr)
        throw typeMismatch("time", value);

    auto const fail = [&value] (std::string_view reason)
    {
        return Error(ErrorKind::patternParse,
                     std::format("{} is not a time of day of the form HH:MM[:SS[.ffffff]]: {}", value.repr(), reason), value);
    };

    auto const isDigit = [] (char c) { return c >= '0' && c <= '9'; };
    auto clock = trim(*text);

    if ((! clock.empty()) && clock.back() == 'Z')
        clock.remove_suffix(1);

    auto const twoDigits = [&clock, &isDigit] (std::size_t pos) -> std::optional<int>
    {
        if (pos + 2 > clock.size() || (! isDigit(clock[pos])) || (! isDigit(clock[pos + 1])))
            return std::nullopt;

        return (clock[pos] - '0') * 10 + (clock[pos + 1] - '0');
    };

    auto const hours = twoDigits(0);
    auto const minutes = clock.size() >= 5 && clock[2] == ':' ? twoDigits(3) : std::nullopt;

    if ((! hours) || (! minutes))
        throw fail("expected HH:MM");

    if (*hours >= 24)
        throw fail("hour out of range");

    if (*minutes >= 60)
        throw fail("minute out of range");

    auto result = std::chrono::microseconds(std::chrono::hours(*hours) + std::chrono::minutes(*minutes));

    if (clock.size() == 5)
        return result;

    auto const seconds = clock[5] == ':' ? twoDigits(6) : std::nullopt;

    if (! seconds)
        throw fail("expected :SS");

    if (*seconds >= 60)
        throw fail("second out of range");

    result += std::chrono::seconds(*seconds);

    if (clock.size() == 8)
        return result;

    if (clock[8] != '.' && clock[8] != ',')
        throw fail("unexpected trailing characters");

    auto const digits = clock.substr(9);

    if (digits.empty() || digits.size() > 6 || (! std::all_of(digits.begin(), digits.end(), isDigit)))
        throw fail("the fraction needs 1 to 6 digits");

    std::int64_t micros = 0;

    for (std::size_t i = 0; i < 6; ++i)
        micros = micros * 10 + (i < digits.size() ? digits[i] - '0' : 0);

    return result + std::chrono::microseconds(micros);
}

std::chrono::duration<double> loadDuration(Value const& value)
{
    if (value.isNumber())
        return std::chrono::duration<double>(value.toDouble());

    if (auto const* text = value.getIf<std::string>())
    {
        if (auto seconds = parseNumber<double>(*text))
            return std::chrono::duration<double>(*seconds);

        auto clock = trim(*text);
        auto const negative = (! clock.empty()) && clock.front() == '-';

        if (negative)
            clock.remove_prefix(1);

        auto const first = clock.find(':');
        auto const second = first == std::string_view::npos ? first : clock.find(':', first + 1);

        if (second != std::string_view::npos)
        {
            auto hours = parseNumber<std::int64_t>(clock.substr(0, first));
            auto minutes = parseNumber<std::int64_t>(clock.substr(first + 1, second - first - 1));
            auto seconds = parseNumber<double>(clock.substr(second + 1));

            if (hours && minutes && seconds && *minutes < 60 && *seconds < 60.0)
            {
                auto const total = static_cast<double>(*hours * 3600 + *minutes * 60) + *seconds;
                return std::chrono::duration<double>(negative ? -total : total);
            }
        }
    }

    throw typeMismatch("duration", value);
}

std::string formatDateTime(Instant instant)
{
    auto const whole = std::chrono::floor<std::chrono::seconds>(instant);

    if (whole == instant)
        return std::format("{:%FT%T}Z", whole);

    return std::format("{:%FT%T}Z", instant);
}

std::string formatDate(std::chrono::year_month_day date)
{
    return std::format("{:%F}", date);
}

Value dumpDateTime(Instant instant, DateTimeOutput output)
{
    if (output == DateTimeOutput::iso)
        return formatDateTime(instant);

    auto const micros = instant.time_since_epoch().count();

    if (micros % 1000000 == 0)
        return Value(micros / 1000000);

    return Value(static_cast<double>(micros) / 1e6);
}

Value dumpDate(std::chrono::year_month_day date, DateTimeOutput output)
{
    if (output == DateTimeOutput::iso)
        return formatDate(date);

    return Value(static_cast<std::int64_t>(std::chrono::sys_days(date).time_since_epoch().count()) * 86400);
}

Value dumpTime(std::chrono::microseconds sinceMidnight)
{
    if (sinceMidnight < std::chrono::microseconds::zero() || sinceMidnight >= std::chrono::hours(24))
        throw Error(ErrorKind::typeMismatch,
                    std::format("time of day {} is outside of [00:00, 24:00)", std::chrono::duration<double>(sinceMidnight)));

    std::chrono::hh_mm_ss const clock(sinceMidnight);
    auto const whole = std::format("{:02}:{:02}:{:02}", clock.hours().count(), clock.minutes().count(), clock.seconds().count());

    if (clock.subseconds().count() == 0)
        return whole;

    return std::format("{}.{:06}", whole, clock.subseconds().count());
}

Value dumpDuration(std::chrono::duration<double> seconds)
{
    auto const count = seconds.count();

    if (std::isfinite(count) && count == std::trunc(count) && std::abs(count) < 9.0e15)
        return Value(static_cast<std::int64_t>(count));

    return Value(count);
}
} // namespace marshal
