#include "descriptor.hpp"
#include <algorithm>
#include <format>
#include <set>
#include "errors.hpp"
#include "marshal_detail.hpp"

namespace marshal
{
std::string TypeDescriptor::binding() const
{
    return std::format("f{}_v{}", fieldOrdinal, iteration);
}

std::string TypeDescriptor::describe() const
{
    std::string result;

    switch (kind)
    {
    case Kind::record:
    case Kind::namedTuple:
    case Kind::enumeration:
    case Kind::custom:
        result = type != nullptr ? type->name() : std::string(toString(kind));
        break;
    default:
        result = toString(kind);

        if (! arguments.empty())
        {
            result += "<";

            for (std::size_t i = 0; i < arguments.size(); ++i)
                result += (i > 0 ? ", " : "") + arguments[i].describe();

            result += ">";
        }
    }

    for (std::size_t i = 0; i < optionals.size(); ++i)
        result = "optional<" + result + ">";

    return result;
}

namespace
{
[[noreturn]] void fail(ResolveContext const&, std::string const& what)
{
    throw Error(ErrorKind::descriptorResolution, what);
}

bool holdsTemporalValue(TypeDescriptor const& descriptor)
{
    if (descriptor.kind == Kind::dateTime || descriptor.kind == Kind::date || descriptor.kind == Kind::duration)
        return true;

    return std::any_of(descriptor.arguments.begin(), descriptor.arguments.end(), holdsTemporalValue);
}
}

TypeDescriptor resolve(MetaType const& declared, ResolveContext& context)
{
    TypeDescriptor descriptor;
    descriptor.fieldName = context.fieldName;
    descriptor.fieldOrdinal = context.fieldOrdinal;
    descriptor.iteration = context.nextIteration++;

    auto const* current = &declared;

    while (current->kind() == Kind::optional)
    {
        auto const& wrapper = static_cast<OptionalMeta const&>(*current);
        descriptor.optionals.push_back(&wrapper);
        current = &wrapper.element();
    }

    descriptor.type = current;
    descriptor.kind = current->kind();
    descriptor.annotations = context.options;

    if (descriptor.kind == Kind::mapping)
    {
        auto const& keyType = static_cast<MappingMeta const&>(*current).key();

        switch (keyType.kind())
        {
        case Kind::string:
        case Kind::integer:
        case Kind::floating:
        case Kind::boolean:
        case Kind::enumeration:
        case Kind::custom:
        case Kind::any:
            break;
        default:
            fail(context, std::format("mapping key type {} has no canonical string form", keyType.name()));
        }
    }

    if (descriptor.kind == Kind::namedTuple)
    {
        auto& chain = context.namedTupleChain;

        if (std::find(chain.begin(), chain.end(), current->typeIndex()) != chain.end())
            fail(context, std::format("named tuple {} contains itself; declare it as a record", current->name()));

        chain.push_back(current->typeIndex());
    }

    auto popChain = detail::callAtEndOfScope([&context, kind = descriptor.kind]
    {
        if (kind == Kind::namedTuple)
            context.namedTupleChain.pop_back();
    });

    switch (descriptor.kind)
    {
    case Kind::record:
        if (context.stack != nullptr)
            descriptor.recursive = std::find(context.stack->begin(), context.stack->end(), current->typeIndex()) != context.stack->end();
        break;

    case Kind::sum:
    {
        auto const alternatives = current->arguments();

        if (alternatives.empty())
            fail(context, std::format("sum type {} has no alternatives", current->name()));

        for (auto alternative : alternatives)
            descriptor.arguments.push_back(resolve(alternative(), context));

        break;
    }

    case Kind::sequence:
    case Kind::set:
    case Kind::mapping:
    case Kind::fixedTuple:
    case Kind::namedTuple:
        for (auto argument : current->arguments())
            descriptor.arguments.push_back(resolve(argument(), context));

        if (descriptor.kind == Kind::mapping)
            descriptor.arguments.front().mapKey = true;

        break;

    default:
        break;
    }

    return descriptor;
}

TypeDescriptor resolveField(FieldDescriptor const& field, std::size_t fieldOrdinal,
                            Config const& config, CompileStack const& stack)
{
    ResolveContext context;
    context.fieldName = std::string(field.fieldname);
    context.fieldOrdinal = fieldOrdinal;
    context.stack = &stack;

    if (field.annotations != nullptr)
        context.options = field.annotations();

    if (auto const* overrides = config.fieldOptions(field.fieldname))
        context.options.mergeFrom(*overrides);

    auto descriptor = resolve(field.metaType(), context);

    if ((! context.options.patterns.empty()) && (! holdsTemporalValue(descriptor)))
        fail(context, std::format("date/time patterns given for a field of type {}", descriptor.describe()));

    if (context.options.catchAll)
    {
        auto const mapLike = descriptor.kind == Kind::any
            || (descriptor.kind == Kind::mapping && descriptor.arguments[0].kind == Kind::string
                && descriptor.arguments[1].kind == Kind::any);

        if (! mapLike)
            fail(context, std::format("catch-all field must hold a Value or map<string, Value>, not {}", descriptor.describe()));
    }

    return descriptor;
}

void checkRecord(MetaType const& record)
{
    std::set<std::string_view> seen;

    for (auto const& field : record.fields())
    {
        if (! seen.insert(field.fieldname).second)
            throw Error(ErrorKind::descriptorResolution,
                        std::format("record {} declares the field \"{}\" more than once", record.name(), field.fieldname));
    }
}
} // namespace marshal
