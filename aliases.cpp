#include "aliases.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include "config.hpp"
#include "errors.hpp"

namespace marshal
{
//=============================================================================
// Key casing implementations
//=============================================================================
std::string_view toString(KeyCase keyCase) noexcept
{
    switch (keyCase)
    {
    case KeyCase::none:      return "none";
    case KeyCase::camel:     return "camel";
    case KeyCase::pascal:    return "pascal";
    case KeyCase::kebab:     return "kebab";
    case KeyCase::snake:     return "snake";
    case KeyCase::automatic: return "auto";
    }

    return "none";
}

namespace
{
bool isUpper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool isLower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
char toUpper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }
char toLower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

/// Replaces '_', '-' and ' ' by separator and collapses runs of it
std::string normaliseSeparators(std::string_view name, char separator)
{
    std::string result;

    for (auto c : name)
    {
        if (c == '_' || c == '-' || c == ' ')
        {
            if (result.empty() || result.back() != separator)
                result += separator;
        }
        else
        {
            result += c;
        }
    }

    return result;
}

std::string toDelimited(std::string_view name, char separator)
{
    auto const s = normaliseSeparators(name, separator);
    std::string result;

    for (std::size_t i = 0; i < s.size(); ++i)
    {
        auto const c = s[i];

        if (! isUpper(c))
        {
            result += c;
            continue;
        }

        auto const afterLowerOrDigit = i > 0 && (isLower(s[i - 1]) || isDigit(s[i - 1]));
        auto const startsWord = i > 0 && s[i - 1] != separator && i + 1 < s.size() && isLower(s[i + 1]);

        if ((afterLowerOrDigit || startsWord) && (result.empty() || result.back() != separator))
            result += separator;

        result += toLower(c);
    }

    return result;
}

std::string toCapitalised(std::string_view name, bool upperFirst)
{
    auto const s = normaliseSeparators(name, '_');

    if (s.empty())
        return s;

    std::string result;
    result += upperFirst ? toUpper(s.front()) : toLower(s.front());

    for (std::size_t i = 1; i < s.size(); ++i)
    {
        if (s[i] == '_' && i + 1 < s.size())
            result += toUpper(s[++i]);
        else
            result += s[i];
    }

    return result;
}
}

std::string toCamelCase(std::string_view name)    { return toCapitalised(name, false); }
std::string toPascalCase(std::string_view name)   { return toCapitalised(name, true); }
std::string toKebabCase(std::string_view name)    { return toDelimited(name, '-'); }
std::string toSnakeCase(std::string_view name)    { return toDelimited(name, '_'); }

std::string applyKeyCase(KeyCase keyCase, std::string_view name)
{
    switch (keyCase)
    {
    case KeyCase::camel:  return toCamelCase(name);
    case KeyCase::pascal: return toPascalCase(name);
    case KeyCase::kebab:  return toKebabCase(name);
    case KeyCase::snake:  return toSnakeCase(name);
    case KeyCase::none:
    case KeyCase::automatic:
        break;
    }

    return std::string(name);
}

//=============================================================================
// KeyPath implementations
//=============================================================================
KeyPath::KeyPath(std::string key) : parts { Segment(std::move(key)) } {}
KeyPath::KeyPath(char const* key) : KeyPath(std::string(key)) {}
KeyPath::KeyPath(std::initializer_list<Segment> segments) : parts(segments) {}

KeyPath KeyPath::parse(std::string_view notation)
{
    auto fail = [notation] (std::string_view reason)
    {
        return Error(ErrorKind::descriptorResolution, std::format("invalid key path \"{}\": {}", notation, reason));
    };

    if (notation.empty())
        throw fail("empty path");

    KeyPath path;
    std::size_t i = 0;

    while (i < notation.size())
    {
        if (notation[i] == '[')
        {
            auto const close = notation.find(']', i);

            if (close == std::string_view::npos)
                throw fail("unterminated '['");

            auto const inner = notation.substr(i + 1, close - i - 1);

            if (inner.empty())
                throw fail("empty index");

            if (inner.size() >= 2 && (inner.front() == '"' || inner.front() == '\'') && inner.back() == inner.front())
            {
                path.parts.emplace_back(std::string(inner.substr(1, inner.size() - 2)));
            }
            else
            {
                std::int64_t index = 0;
                auto const* end = inner.data() + inner.size();
                auto [ptr, ec] = std::from_chars(inner.data(), end, index);

                if (ec == std::errc() && ptr == end)
                    path.parts.emplace_back(index);
                else
                    path.parts.emplace_back(std::string(inner));
            }

            i = close + 1;
        }
        else
        {
            auto end = notation.find_first_of(".[", i);

            if (end == std::string_view::npos)
                end = notation.size();

            auto const key = notation.substr(i, end - i);

            if (key.empty())
                throw fail("empty key");

            if (key.find(']') != std::string_view::npos)
                throw fail("unbalanced ']'");

            path.parts.emplace_back(std::string(key));
            i = end;
        }

        if (i < notation.size() && notation[i] == '.')
        {
            if (++i == notation.size())
                throw fail("trailing '.'");
        }
    }

    return path;
}

bool KeyPath::isFlat() const noexcept
{
    return parts.size() == 1 && std::holds_alternative<std::string>(parts.front());
}

std::string KeyPath::head() const
{
    if (parts.empty())
        return {};

    if (auto const* key = std::get_if<std::string>(&parts.front()))
        return *key;

    return std::to_string(std::get<std::int64_t>(parts.front()));
}

std::string KeyPath::toString() const
{
    std::string result;

    for (auto const& segment : parts)
    {
        if (auto const* key = std::get_if<std::string>(&segment))
        {
            if (key->find_first_of(".[]") != std::string::npos)
                result += std::format("[\"{}\"]", *key);
            else
                result += (result.empty() ? "" : ".") + *key;
        }
        else
        {
            result += std::format("[{}]", std::get<std::int64_t>(segment));
        }
    }

    return result;
}

Value const* KeyPath::lookup(Value const& root) const
{
    auto const* current = &root;

    for (auto const& segment : parts)
    {
        if (auto const* key = std::get_if<std::string>(&segment))
        {
            auto const* map = current->getIf<Map>();

            if (map == nullptr)
                return nullptr;

            current = map->find(std::string_view(*key));
        }
        else
        {
            auto const index = std::get<std::int64_t>(segment);

            if (auto const* map = current->getIf<Map>())
            {
                current = map->find(Value(index));
            }
            else if (auto const* seq = current->getIf<Sequence>())
            {
                auto const size = static_cast<std::int64_t>(seq->size());
                auto const resolved = index < 0 ? size + index : index;

                if (resolved < 0 || resolved >= size)
                    return nullptr;

                current = &(*seq)[static_cast<std::size_t>(resolved)];
            }
            else
            {
                return nullptr;
            }
        }

        if (current == nullptr)
            return nullptr;
    }

    return current;
}

void KeyPath::assign(Value& root, Value value) const
{
    auto* current = &root;

    for (auto const& segment : parts)
    {
        if (auto const* key = std::get_if<std::string>(&segment))
        {
            if (! current->isMap())
                *current = Map();

            current = &current->as<Map>()[*key];
        }
        else
        {
            if (! current->isSequence())
                *current = Sequence();

            auto& seq = current->as<Sequence>();
            auto index = std::get<std::int64_t>(segment);

            // negative indices count from the end and never grow the sequence
            if (index < 0)
            {
                index += static_cast<std::int64_t>(seq.size());

                if (index < 0)
                    throw Error(ErrorKind::descriptorResolution,
                                std::format("cannot assign path \"{}\": index {} is before the start of a sequence of {} elements",
                                            toString(), std::get<std::int64_t>(segment), seq.size()));
            }

            if (seq.size() <= static_cast<std::size_t>(index))
                seq.resize(static_cast<std::size_t>(index) + 1);

            current = &seq[static_cast<std::size_t>(index)];
        }
    }

    *current = std::move(value);
}

//=============================================================================
// Field key resolution
//=============================================================================
FieldKeys resolveFieldKeys(std::string_view fieldName, FieldOptions const& options, Config const& config)
{
    FieldKeys keys;

    auto addCandidate = [&keys] (KeyPath path)
    {
        if (std::find(keys.load.begin(), keys.load.end(), path) == keys.load.end())
            keys.load.push_back(std::move(path));
    };

    for (auto const& alias : options.loadAliases)
        addCandidate(alias);

    auto const loadCase = config.keyCasingLoad.value_or(KeyCase::none);
    addCandidate(KeyPath(applyKeyCase(loadCase, fieldName)));

    if (loadCase == KeyCase::automatic)
    {
        for (auto keyCase : { KeyCase::camel, KeyCase::pascal, KeyCase::kebab, KeyCase::snake })
            addCandidate(KeyPath(applyKeyCase(keyCase, fieldName)));
    }

    if (options.dumpAlias.has_value())
        keys.dump = *options.dumpAlias;
    else if (! options.loadAliases.empty())
        keys.dump = options.loadAliases.front();
    else
        keys.dump = KeyPath(applyKeyCase(config.keyCasingDump.value_or(KeyCase::none), fieldName));

    return keys;
}
} // namespace marshal
