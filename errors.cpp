#include "errors.hpp"
#include <format>

namespace marshal
{
std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::descriptorResolution: return "descriptor resolution error";
    case ErrorKind::missingField:         return "missing required field";
    case ErrorKind::unknownKey:           return "unknown key";
    case ErrorKind::typeMismatch:         return "type mismatch";
    case ErrorKind::lengthMismatch:       return "length mismatch";
    case ErrorKind::tagDispatch:          return "tag dispatch failure";
    case ErrorKind::patternParse:         return "pattern parse failure";
    case ErrorKind::unsupportedType:      return "unsupported type";
    case ErrorKind::aggregate:            return "multiple errors";
    }

    return "error";
}

Error::Error(ErrorKind kind, std::string message, std::optional<Value> offendingValue)
    : std::runtime_error(message),
      errorKind(kind),
      msg(std::move(message)),
      rawValue(std::move(offendingValue))
{
    rebuild();
}

Error Error::aggregate(std::vector<Error> errors)
{
    std::vector<Error> flat;

    for (auto& e : errors)
    {
        if (e.kind() == ErrorKind::aggregate)
            flat.insert(flat.end(), e.children.begin(), e.children.end());
        else
            flat.push_back(std::move(e));
    }

    Error result(ErrorKind::aggregate, std::format("{} errors", flat.size()));
    result.children = std::move(flat);
    result.rebuild();
    return result;
}

std::string Error::pathString() const
{
    std::string result;

    for (auto const& segment : segments)
    {
        if ((! result.empty()) && segment.front() != '[')
            result += '.';

        result += segment;
    }

    return result;
}

Error& Error::prependField(std::string_view name)
{
    segments.insert(segments.begin(), std::string(name));

    for (auto& child : children)
        child.prependField(name);

    rebuild();
    return *this;
}

Error& Error::prependIndex(std::size_t index)
{
    segments.insert(segments.begin(), std::format("[{}]", index));

    for (auto& child : children)
        child.prependIndex(index);

    rebuild();
    return *this;
}

Error& Error::prependKey(std::string_view key)
{
    segments.insert(segments.begin(), std::format("[\"{}\"]", key));

    for (auto& child : children)
        child.prependKey(key);

    rebuild();
    return *this;
}

Error& Error::inRecord(std::string_view name)
{
    recordName = name;

    for (auto& child : children)
        child.inRecord(name);

    rebuild();
    return *this;
}

void Error::rebuild()
{
    auto location = pathString();

    if (! recordName.empty())
        location = location.empty() ? recordName : recordName + "." + location;

    text = location.empty() ? msg : location + ": " + msg;

    if (rawValue.has_value() && errorKind != ErrorKind::typeMismatch)
        text += std::format(" (value: {})", *rawValue);

    for (auto const& child : children)
        text += "\n  - " + std::string(child.what());
}

Error typeMismatch(std::string_view expected, Value const& got)
{
    return Error(ErrorKind::typeMismatch, std::format("expected {}, got {} {}", expected, got.typeName(), got.repr()), got);
}
} // namespace marshal
