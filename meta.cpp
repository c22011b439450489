#include "meta.hpp"
#include <cstdlib>
#include <memory>
#include <cxxabi.h>
#include "marshal_detail.hpp"

namespace marshal
{
namespace detail
{
std::string demangle(std::type_info const& info)
{
    auto status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free);

    return status == 0 && demangled != nullptr ? std::string(demangled.get()) : std::string(info.name());
}

std::string unqualifiedName(std::type_info const& info)
{
    auto name = demangle(info);

    if (auto const args = name.find('<'); args != std::string::npos)
        name.erase(args);

    if (auto const scope = name.rfind("::"); scope != std::string::npos)
        name.erase(0, scope + 2);

    return name;
}
} // namespace detail

std::string_view toString(Kind kind) noexcept
{
    switch (kind)
    {
    case Kind::any:         return "any";
    case Kind::boolean:     return "boolean";
    case Kind::integer:     return "integer";
    case Kind::floating:    return "float";
    case Kind::string:      return "string";
    case Kind::bytes:       return "bytes";
    case Kind::enumeration: return "enumeration";
    case Kind::dateTime:    return "datetime";
    case Kind::date:        return "date";
    case Kind::time:        return "time";
    case Kind::duration:    return "duration";
    case Kind::sequence:    return "sequence";
    case Kind::set:         return "set";
    case Kind::fixedTuple:  return "tuple";
    case Kind::namedTuple:  return "named tuple";
    case Kind::mapping:     return "mapping";
    case Kind::record:      return "record";
    case Kind::sum:         return "sum";
    case Kind::optional:    return "optional";
    case Kind::custom:      return "custom";
    }

    return "unknown";
}

std::string MetaType::name() const
{
    return detail::demangle(typeInfo());
}
} // namespace marshal
