#include "union_dispatch.hpp"
#include <algorithm>
#include <format>
#include <memory>
#include <typeinfo>
#include <variant>
#include "assembler.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "marshal_detail.hpp"

namespace marshal
{
std::optional<std::string> tagOf(MetaType const& alternative, Config const& enclosing)
{
    if (alternative.kind() != Kind::record)
        return std::nullopt;

    auto const own = static_cast<RecordMeta const&>(alternative).ownConfig();

    if (own.tag.has_value())
        return own.tag;

    if (own.autoAssignTags.value_or(enclosing.autoAssignTags.value_or(false)))
        return detail::unqualifiedName(alternative.typeInfo());

    return std::nullopt;
}

//=============================================================================
UnionDispatcher::UnionDispatcher(SumMeta const& sumMeta, std::vector<Alternative> alts, std::string key, bool unsafeDispatch)
    : meta(sumMeta), alternatives(std::move(alts)), tagKey(std::move(key)), unsafe(unsafeDispatch)
{
    std::vector<std::string> seen;

    for (auto const& alternative : alternatives)
    {
        if (! alternative.tag.has_value())
            continue;

        if (std::find(seen.begin(), seen.end(), *alternative.tag) != seen.end())
            throw Error(ErrorKind::descriptorResolution,
                        std::format("tag \"{}\" is used by more than one alternative of {}", *alternative.tag, meta.name()));

        seen.push_back(*alternative.tag);
    }

    usesTags = ! seen.empty();
}

std::vector<std::string> UnionDispatcher::knownTags() const
{
    std::vector<std::string> tags;

    for (auto const& alternative : alternatives)
        if (alternative.tag.has_value())
            tags.push_back(*alternative.tag);

    return tags;
}

void UnionDispatcher::loadAlternative(Alternative const& alternative, Value const& value, void* target) const
{
    alternative.fragment.load(value, meta.emplace(target, alternative.index));
}

bool UnionDispatcher::matchesExactly(Alternative const& alternative, Value const& value) const
{
    switch (alternative.kind)
    {
    case Kind::boolean:  return value.isBool();
    case Kind::integer:  return value.isInteger();
    case Kind::floating: return value.isFloating();
    case Kind::string:   return value.isString();
    case Kind::record:
    case Kind::mapping:  return value.isMap();
    case Kind::sequence:
    case Kind::set:
    case Kind::fixedTuple: return value.isSequence();
    default:             return false;
    }
}

void UnionDispatcher::load(Value const& value, void* target) const
{
    if (usesTags && value.isMap())
    {
        if (auto const* tagValue = value.as<Map>().find(std::string_view(tagKey)))
        {
            auto const text = tagValue->toText();
            auto const match = std::find_if(alternatives.begin(), alternatives.end(),
                                            [&] (Alternative const& alternative) { return alternative.tag == text; });

            if (match == alternatives.end())
            {
                std::string known;

                for (auto const& tag : knownTags())
                    known += (known.empty() ? "" : ", ") + Value(tag).repr();

                throw Error(ErrorKind::tagDispatch,
                            std::format("tag {} under \"{}\" matches none of the known tags [{}]", tagValue->repr(), tagKey, known), value);
            }

            Map untagged = value.as<Map>();
            untagged.erase(tagKey);

            return loadAlternative(*match, Value(std::move(untagged)), target);
        }
    }

    if (value.isNull())
    {
        if (auto const null = meta.nullAlternative())
        {
            meta.emplace(target, *null);
            return;
        }
    }

    if (unsafe && value.isMap())
    {
        auto const record = std::find_if(alternatives.begin(), alternatives.end(),
                                         [] (Alternative const& alternative) { return alternative.kind == Kind::record; });

        if (record != alternatives.end())
            return loadAlternative(*record, value, target);
    }

    std::vector<std::string> failures;

    auto const attempt = [&] (Alternative const& alternative)
    {
        try
        {
            loadAlternative(alternative, value, target);
            return true;
        }
        catch (Error const& e)
        {
            failures.push_back(std::format("{}: {}", alternative.name, e.what()));
            return false;
        }
    };

    for (auto const& alternative : alternatives)
        if (matchesExactly(alternative, value) && attempt(alternative))
            return;

    for (auto const& alternative : alternatives)
        if ((! matchesExactly(alternative, value)) && attempt(alternative))
            return;

    std::string names;

    for (auto const& alternative : alternatives)
        names += (names.empty() ? "" : ", ") + alternative.name;

    for (auto const& failure : failures)
        log(LogLevel::debug, "union alternative rejected: {}", failure);

    throw Error(ErrorKind::tagDispatch, std::format("{} matches none of the alternatives of {} ({})", value.repr(), meta.name(), names), value);
}

Value UnionDispatcher::dump(void const* source) const
{
    auto const index = meta.index(source);

    if (meta.nullAlternative() == index)
        return {};

    auto const match = std::find_if(alternatives.begin(), alternatives.end(),
                                    [index] (Alternative const& alternative) { return alternative.index == index; });

    if (match == alternatives.end())
        throw Error(ErrorKind::unsupportedType, std::format("{} holds alternative {} which has no conversion", meta.name(), index));

    auto dumped = match->fragment.dump(meta.get(source, index));

    if ((! match->tag.has_value()) || (! dumped.isMap()))
        return dumped;

    Map tagged;
    tagged.insertOrAssign(tagKey, *match->tag);

    for (auto& entry : dumped.as<Map>())
        if (! (entry.key.isString() && entry.key.as<std::string>() == tagKey))
            tagged.insertOrAssign(std::move(entry.key), std::move(entry.value));

    return Value(std::move(tagged));
}

//=============================================================================
Fragment emitSum(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<SumMeta const&>(*descriptor.type);
    auto const null = meta.nullAlternative();

    std::vector<UnionDispatcher::Alternative> alternatives;

    for (std::size_t i = 0; i < descriptor.arguments.size(); ++i)
    {
        if (null == i)
            continue;

        auto const& argument = descriptor.arguments[i];

        UnionDispatcher::Alternative alternative { i, argument.kind, argument.describe(), std::nullopt, context.emit(argument) };

        if (! argument.inOptional())
            alternative.tag = tagOf(*argument.type, context.config());

        alternatives.push_back(std::move(alternative));
    }

    auto const dispatcher = context.symbols().bind("union_" + descriptor.binding(),
        std::make_shared<UnionDispatcher>(meta, std::move(alternatives), context.config().effectiveTagKey(),
                                          context.config().unsafeUnionDispatch.value_or(false)));

    return
    {
        descriptor.binding(),
        [dispatcher] (Value const& value, void* target) { dispatcher->load(value, target); },
        [dispatcher] (void const* source) { return dispatcher->dump(source); }
    };
}
} // namespace marshal
