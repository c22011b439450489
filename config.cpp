#include "config.hpp"
#include <format>

namespace marshal
{
namespace
{
/// Text embedded in a fingerprint; separators inside it cannot make two fingerprints collide
std::string lengthPrefixed(std::string_view text)
{
    return std::format("{}:{}", text.size(), text);
}
}

//=============================================================================
// Condition implementations
//=============================================================================
bool Condition::operator()(Value const& value) const
{
    switch (operation)
    {
    case Op::eq:        return value == rhs;
    case Op::ne:        return ! (value == rhs);
    case Op::lt:        return (value <=> rhs) == std::partial_ordering::less;
    case Op::le:        return value == rhs || (value <=> rhs) == std::partial_ordering::less;
    case Op::gt:        return (value <=> rhs) == std::partial_ordering::greater;
    case Op::ge:        return value == rhs || (value <=> rhs) == std::partial_ordering::greater;
    case Op::isNull:    return value.isNull();
    case Op::isNotNull: return ! value.isNull();
    case Op::isTruthy:  return value.truthy();
    case Op::isFalsy:   return ! value.truthy();
    }

    return false;
}

std::string Condition::describe() const
{
    switch (operation)
    {
    case Op::eq:        return std::format("== {}", rhs);
    case Op::ne:        return std::format("!= {}", rhs);
    case Op::lt:        return std::format("< {}", rhs);
    case Op::le:        return std::format("<= {}", rhs);
    case Op::gt:        return std::format("> {}", rhs);
    case Op::ge:        return std::format(">= {}", rhs);
    case Op::isNull:    return "is null";
    case Op::isNotNull: return "is not null";
    case Op::isTruthy:  return "is truthy";
    case Op::isFalsy:   return "is falsy";
    }

    return {};
}

//=============================================================================
// FieldOptions implementations
//=============================================================================
void FieldOptions::mergeFrom(FieldOptions const& higher)
{
    if (! higher.loadAliases.empty())
        loadAliases = higher.loadAliases;

    if (higher.dumpAlias.has_value())
        dumpAlias = higher.dumpAlias;

    if (! higher.patterns.empty())
        patterns = higher.patterns;

    if (higher.skipIf.has_value())
        skipIf = higher.skipIf;

    exclude = exclude || higher.exclude;
    catchAll = catchAll || higher.catchAll;
}

std::string FieldOptions::fingerprint() const
{
    std::string result = "{";

    if (! loadAliases.empty())
    {
        result += "la=";

        for (auto const& alias : loadAliases)
            result += lengthPrefixed(alias.toString()) + ",";
    }

    if (dumpAlias.has_value())
        result += "da=" + lengthPrefixed(dumpAlias->toString()) + ";";

    if (! patterns.empty())
    {
        result += "p=";

        for (auto const& pattern : patterns)
            result += lengthPrefixed(pattern) + ",";
    }

    if (skipIf.has_value())
        result += "s=" + lengthPrefixed(skipIf->describe()) + ";";

    if (exclude)
        result += "x;";

    if (catchAll)
        result += "c;";

    return result + "}";
}

//=============================================================================
// Config implementations
//=============================================================================
std::string_view toString(UnknownKeyAction action) noexcept
{
    switch (action)
    {
    case UnknownKeyAction::ignore: return "ignore";
    case UnknownKeyAction::warn:   return "warn";
    case UnknownKeyAction::raise:  return "raise";
    }

    return "ignore";
}

std::string_view toString(DateTimeOutput output) noexcept
{
    return output == DateTimeOutput::timestamp ? "timestamp" : "iso";
}

std::string_view toString(EnumMatch match) noexcept
{
    return match == EnumMatch::byName ? "name" : "value";
}

std::string_view toString(FractionalIntegers policy) noexcept
{
    return policy == FractionalIntegers::reject ? "reject" : "round";
}

Config Config::merge(Config const& own, Config const& inherited)
{
    auto pick = [] <typename T> (std::optional<T> const& mine, std::optional<T> const& theirs)
    {
        return mine.has_value() ? mine : theirs;
    };

    Config result;
    result.keyCasingLoad       = pick(own.keyCasingLoad, inherited.keyCasingLoad);
    result.keyCasingDump       = pick(own.keyCasingDump, inherited.keyCasingDump);
    result.tagKey              = pick(own.tagKey, inherited.tagKey);
    result.autoAssignTags      = pick(own.autoAssignTags, inherited.autoAssignTags);
    result.unsafeUnionDispatch = pick(own.unsafeUnionDispatch, inherited.unsafeUnionDispatch);
    result.onUnknownKey        = pick(own.onUnknownKey, inherited.onUnknownKey);
    result.skipIf              = pick(own.skipIf, inherited.skipIf);
    result.skipDefaults        = pick(own.skipDefaults, inherited.skipDefaults);
    result.dateTimeOutput      = pick(own.dateTimeOutput, inherited.dateTimeOutput);
    result.namedTupleAsMap     = pick(own.namedTupleAsMap, inherited.namedTupleAsMap);
    result.enumMatch           = pick(own.enumMatch, inherited.enumMatch);
    result.fractionalIntegers  = pick(own.fractionalIntegers, inherited.fractionalIntegers);
    result.collectErrors       = pick(own.collectErrors, inherited.collectErrors);

    // record-local options
    result.fields    = own.fields;
    result.tag       = own.tag;
    result.recursive = own.recursive;

    return result;
}

Config Config::atCallSite(Config const& own, Config const& caller)
{
    auto result = merge(own, caller);

    for (auto const& [name, options] : caller.fields)
        result.fields[name].mergeFrom(options);

    if (caller.tag.has_value())
        result.tag = caller.tag;

    if (caller.recursive.has_value())
        result.recursive = caller.recursive;

    return result;
}

std::string Config::fingerprint() const
{
    std::string result;

    auto add = [&result] <typename T> (std::string_view key, std::optional<T> const& option)
    {
        if (! option.has_value())
            return;

        if constexpr (std::is_same_v<T, bool>)
            result += std::format("{}={};", key, *option ? 1 : 0);
        else if constexpr (std::is_same_v<T, std::string>)
            result += std::format("{}={};", key, lengthPrefixed(*option));
        else if constexpr (std::is_same_v<T, Condition>)
            result += std::format("{}={};", key, lengthPrefixed(option->describe()));
        else
            result += std::format("{}={};", key, toString(*option));
    };

    add("klc", keyCasingLoad);
    add("kdc", keyCasingDump);
    add("tk", tagKey);
    add("tag", tag);
    add("aat", autoAssignTags);
    add("uud", unsafeUnionDispatch);
    add("uk", onUnknownKey);
    add("si", skipIf);
    add("sd", skipDefaults);
    add("rec", recursive);
    add("dto", dateTimeOutput);
    add("ntm", namedTupleAsMap);
    add("em", enumMatch);
    add("fi", fractionalIntegers);
    add("ce", collectErrors);

    for (auto const& [name, options] : fields)
        result += std::format("f.{}={};", lengthPrefixed(name), options.fingerprint());

    return result;
}

std::string Config::effectiveTagKey() const
{
    return tagKey.value_or(std::string(kDefaultTagKey));
}

FieldOptions const* Config::fieldOptions(std::string_view name) const
{
    auto it = fields.find(std::string(name));
    return it != fields.end() ? &it->second : nullptr;
}
} // namespace marshal
