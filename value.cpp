#include "value.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <ostream>
#include <sstream>
#include "marshal_detail.hpp"

namespace marshal
{
//=============================================================================
// Map implementations
//=============================================================================
Map::Map() = default;
Map::Map(std::initializer_list<MapEntry> list) : entries(list) {}
Map::Map(Map const&) = default;
Map::Map(Map&&) noexcept = default;
Map::~Map() = default;
Map& Map::operator=(Map const&) = default;
Map& Map::operator=(Map&&) noexcept = default;

Value const* Map::find(Value const& key) const
{
    auto it = std::find_if(entries.begin(), entries.end(), [&key] (MapEntry const& e) { return e.key == key; });
    return it != entries.end() ? &it->value : nullptr;
}

Value* Map::find(Value const& key)
{
    return const_cast<Value*>(std::as_const(*this).find(key));
}

Value const* Map::find(std::string_view key) const
{
    auto it = std::find_if(entries.begin(), entries.end(), [key] (MapEntry const& e)
    {
        auto const* str = e.key.getIf<std::string>();
        return str != nullptr && *str == key;
    });

    return it != entries.end() ? &it->value : nullptr;
}

Value* Map::find(std::string_view key)
{
    return const_cast<Value*>(std::as_const(*this).find(key));
}

Value& Map::insertOrAssign(Value key, Value value)
{
    if (auto* existing = find(key))
    {
        *existing = std::move(value);
        return *existing;
    }

    entries.push_back(MapEntry { std::move(key), std::move(value) });
    return entries.back().value;
}

Value& Map::operator[](std::string_view key)
{
    if (auto* existing = find(key))
        return *existing;

    entries.push_back(MapEntry { Value(key), Value() });
    return entries.back().value;
}

bool Map::erase(std::string_view key)
{
    auto it = std::find_if(entries.begin(), entries.end(), [key] (MapEntry const& e)
    {
        auto const* str = e.key.getIf<std::string>();
        return str != nullptr && *str == key;
    });

    if (it == entries.end())
        return false;

    entries.erase(it);
    return true;
}

std::size_t Map::size() const noexcept       { return entries.size(); }
bool Map::empty() const noexcept             { return entries.empty(); }
Map::iterator Map::begin()                   { return entries.begin(); }
Map::iterator Map::end()                     { return entries.end(); }
Map::const_iterator Map::begin() const       { return entries.begin(); }
Map::const_iterator Map::end() const         { return entries.end(); }

bool operator==(Map const& a, Map const& b)
{
    if (a.size() != b.size())
        return false;

    for (auto const& entry : a)
    {
        auto const* other = b.find(entry.key);

        if (other == nullptr || ! (*other == entry.value))
            return false;
    }

    return true;
}

//=============================================================================
// Value implementations
//=============================================================================
std::string_view typeName(Value::Type t) noexcept
{
    switch (t)
    {
    case Value::Type::null:     return "null";
    case Value::Type::boolean:  return "boolean";
    case Value::Type::integer:  return "integer";
    case Value::Type::floating: return "float";
    case Value::Type::string:   return "string";
    case Value::Type::sequence: return "sequence";
    case Value::Type::map:      return "map";
    }

    return "unknown";
}

std::string_view Value::typeName() const noexcept
{
    return marshal::typeName(type());
}

double Value::toDouble() const
{
    if (auto const* i = getIf<std::int64_t>())
        return static_cast<double>(*i);

    return as<double>();
}

bool Value::truthy() const noexcept
{
    return visit(detail::multilambda {
        [] (Null)                       { return false; },
        [] (bool b)                     { return b; },
        [] (std::int64_t i)             { return i != 0; },
        [] (double d)                   { return d != 0.0; },
        [] (std::string const& s)       { return ! s.empty(); },
        [] (Sequence const& s)          { return ! s.empty(); },
        [] (Map const& m)               { return ! m.empty(); }
    });
}

namespace
{
std::string formatDouble(double d)
{
    if (std::isnan(d))
        return "nan";

    if (std::isinf(d))
        return d < 0 ? "-inf" : "inf";

    std::array<char, 64> buffer {};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), d);
    std::string result(buffer.data(), ec == std::errc() ? end : buffer.data());

    // keep doubles recognisable as such in diagnostics
    if (result.find_first_of(".e") == std::string::npos)
        result += ".0";

    return result;
}

std::string quote(std::string_view s)
{
    std::string result = "\"";

    for (auto c : s)
    {
        switch (c)
        {
        case '"':  result += "\\\""; break;
        case '\\': result += "\\\\"; break;
        case '\n': result += "\\n";  break;
        case '\t': result += "\\t";  break;
        default:   result += c;
        }
    }

    return result + '"';
}
}

std::string Value::toText() const
{
    if (auto const* s = getIf<std::string>())
        return *s;

    return repr();
}

std::string Value::repr() const
{
    return visit(detail::multilambda {
        [] (Null) -> std::string                    { return "null"; },
        [] (bool b) -> std::string                  { return b ? "true" : "false"; },
        [] (std::int64_t i) -> std::string          { return std::to_string(i); },
        [] (double d) -> std::string                { return formatDouble(d); },
        [] (std::string const& s) -> std::string    { return quote(s); },
        [] (Sequence const& seq) -> std::string
        {
            std::string result = "[";
            auto first = true;

            for (auto const& element : seq)
            {
                if (! std::exchange(first, false))
                    result += ", ";

                result += element.repr();
            }

            return result + "]";
        },
        [] (Map const& map) -> std::string
        {
            std::string result = "{";
            auto first = true;

            for (auto const& entry : map)
            {
                if (! std::exchange(first, false))
                    result += ", ";

                result += entry.key.repr() + ": " + entry.value.repr();
            }

            return result + "}";
        }
    });
}

bool operator==(Value const& a, Value const& b)
{
    if (a.isNumber() && b.isNumber())
    {
        if (a.isInteger() && b.isInteger())
            return a.as<std::int64_t>() == b.as<std::int64_t>();

        return a.toDouble() == b.toDouble();
    }

    return a.storage == b.storage;
}

std::partial_ordering operator<=>(Value const& a, Value const& b)
{
    if (a.isNumber() && b.isNumber())
    {
        if (a.isInteger() && b.isInteger())
            return a.as<std::int64_t>() <=> b.as<std::int64_t>();

        return a.toDouble() <=> b.toDouble();
    }

    if (a.isString() && b.isString())
        return a.as<std::string>() <=> b.as<std::string>();

    if (a.isBool() && b.isBool())
        return a.as<bool>() <=> b.as<bool>();

    if (a == b)
        return std::partial_ordering::equivalent;

    return std::partial_ordering::unordered;
}

std::ostream& operator<<(std::ostream& o, Value const& v)
{
    return o << v.repr();
}

std::ostream& operator<<(std::ostream& o, Value::Type t)
{
    return o << typeName(t);
}
} // namespace marshal
