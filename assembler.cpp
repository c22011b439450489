#include "assembler.hpp"
#include <algorithm>
#include <format>
#include <mutex>
#include <set>
#include <stdexcept>
#include "cache.hpp"
#include "handlers.hpp"
#include "logging.hpp"
#include "marshal_detail.hpp"
#include "registry.hpp"
#include "union_dispatch.hpp"

namespace marshal
{
//=============================================================================
// SymbolTable
//=============================================================================
void SymbolTable::insert(std::string name, std::type_index type, std::shared_ptr<void const> value)
{
    if (symbols.contains(name))
        throw std::logic_error(std::format("symbol {} bound twice", name));

    symbols.emplace(std::move(name), Symbol { type, std::move(value) });
}

std::vector<std::string> SymbolTable::names() const
{
    std::vector<std::string> result;

    for (auto const& [name, symbol] : symbols)
        result.push_back(name);

    return result;
}

//=============================================================================
// Routine
//=============================================================================
Routine::Routine(MetaType const& type, Config config, SymbolTable symbols,
                 LoadFn load, DumpFn dump, std::vector<std::string> listing)
    : metaType(type), effective(std::move(config)), symbolTable(std::move(symbols)),
      loadFn(std::move(load)), dumpFn(std::move(dump)), lines(std::move(listing))
{}

//=============================================================================
// RoutineAssembler
//=============================================================================
namespace
{
/// Everything the record routine needs to know about one field
struct FieldPlan
{
    std::string name;
    std::size_t index = 0;
    Fragment fragment;
    FieldKeys keys;
    bool hasDefault = false;
    bool exclude = false;
    bool catchAll = false;
    std::optional<Condition> skipIf;
};

/// Dumped field defaults, computed on first use since recursive fields need published routines
struct DefaultDumps
{
    std::once_flag once;
    std::vector<std::optional<Value>> values;
};

std::string joinKeys(std::vector<KeyPath> const& keys)
{
    std::string result;

    for (auto const& key : keys)
        result += (result.empty() ? "" : ", ") + key.toString();

    return result;
}

template <typename Container>
std::string joinQuoted(Container const& items)
{
    std::string result;

    for (auto const& item : items)
        result += (result.empty() ? "" : ", ") + Value(item).repr();

    return result;
}

/// Either collects error or rethrows it
void report(Error error, std::vector<Error>* collected)
{
    if (collected == nullptr)
        throw error;

    collected->push_back(std::move(error));
}
}

RoutineAssembler::RoutineAssembler(MetaType const& metaType, Config config, RoutineCache& routineCache,
                                   ExtensionRegistry const& extensions, CompileStack& compileStack)
    : type(metaType), effective(std::move(config)), cache(routineCache), registry(extensions), stack(compileStack)
{}

std::shared_ptr<Routine const> RoutineAssembler::assemble()
{
    return type.kind() == Kind::record ? assembleRecord() : assembleValue();
}

std::shared_ptr<Routine const> RoutineAssembler::assembleValue()
{
    SymbolTable symbols;
    CompileContext context(cache, registry, effective, symbols, stack);

    ResolveContext resolveContext;
    resolveContext.stack = &stack;

    auto const descriptor = resolve(type, resolveContext);
    auto fragment = context.emit(descriptor);

    std::vector<std::string> listing { std::format("{} {}", fragment.binding, descriptor.describe()) };

    return std::make_shared<Routine const>(type, effective, std::move(symbols),
                                           std::move(fragment.load), std::move(fragment.dump), std::move(listing));
}

std::shared_ptr<Routine const> RoutineAssembler::assembleRecord()
{
    auto const& meta = static_cast<RecordMeta const&>(type);
    auto const recordName = detail::unqualifiedName(meta.typeInfo());

    try
    {
        checkRecord(meta);
    }
    catch (Error& e)
    {
        e.inRecord(recordName);
        throw;
    }

    stack.push_back(meta.typeIndex());
    auto popStack = detail::callAtEndOfScope([this] { stack.pop_back(); });

    SymbolTable symbols;
    CompileContext context(cache, registry, effective, symbols, stack);

    auto const collect = effective.collectErrors.value_or(false);
    std::vector<Error> errors;

    auto plans = std::make_shared<std::vector<FieldPlan>>();
    std::vector<std::string> listing;
    auto const fields = meta.fields();

    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        auto const& field = fields[i];

        try
        {
            auto const descriptor = resolveField(field, i, effective, stack);

            FieldPlan plan;
            plan.name = std::string(field.fieldname);
            plan.index = i;
            plan.fragment = context.emit(descriptor);
            plan.keys = resolveFieldKeys(field.fieldname, descriptor.annotations, effective);
            plan.hasDefault = meta.hasDefault(i);
            plan.exclude = descriptor.annotations.exclude;
            plan.catchAll = descriptor.annotations.catchAll;
            plan.skipIf = descriptor.annotations.skipIf.has_value() ? descriptor.annotations.skipIf : effective.skipIf;

            listing.push_back(std::format("{} {}: {} <- [{}] -> {}", plan.fragment.binding, plan.name, descriptor.describe(),
                                          joinKeys(plan.keys.load), plan.keys.dump.toString()));
            plans->push_back(std::move(plan));
        }
        catch (Error& e)
        {
            e.prependField(field.fieldname);
            e.inRecord(recordName);
            report(std::move(e), collect ? &errors : nullptr);
        }
    }

    if (! errors.empty())
        throw Error::aggregate(std::move(errors));

    auto const catchAllCount = std::count_if(plans->begin(), plans->end(), [] (FieldPlan const& plan) { return plan.catchAll; });

    if (catchAllCount > 1)
        throw Error(ErrorKind::descriptorResolution, "only one catch-all field is allowed").inRecord(recordName);

    auto knownKeys = std::make_shared<std::set<std::string, std::less<>>>();

    // a tagged record also accepts its tag when loaded on its own
    if (effective.tag.has_value() || effective.autoAssignTags.value_or(false))
        knownKeys->insert(effective.effectiveTagKey());

    for (auto const& plan : *plans)
        for (auto const& key : plan.keys.load)
            knownKeys->insert(key.head());

    symbols.bind("fields", plans);
    symbols.bind("known_keys", knownKeys);

    auto const unknownKeys = effective.onUnknownKey.value_or(UnknownKeyAction::ignore);
    auto const skipDefaults = effective.skipDefaults.value_or(false);

    auto load = [&meta, plans, knownKeys, recordName, collect, unknownKeys] (Value const& value, void* target)
    {
        try
        {
            auto const* map = value.getIf<Map>();

            if (map == nullptr)
                throw typeMismatch("map", value);

            meta.reset(target);

            std::vector<Error> errors;
            auto* collected = collect ? &errors : nullptr;
            FieldPlan const* catchAll = nullptr;

            for (auto const& plan : *plans)
            {
                if (plan.catchAll)
                {
                    catchAll = &plan;
                    continue;
                }

                Value const* found = nullptr;

                for (auto const& key : plan.keys.load)
                    if ((found = key.lookup(value)) != nullptr)
                        break;

                try
                {
                    if (found == nullptr)
                    {
                        if (! plan.hasDefault)
                            throw Error(ErrorKind::missingField,
                                        std::format("missing required field (tried {})", joinKeys(plan.keys.load)));

                        continue;
                    }

                    plan.fragment.load(*found, meta.field(target, plan.index));
                }
                catch (Error& e)
                {
                    e.prependField(plan.name);
                    report(std::move(e), collected);
                }
            }

            if (catchAll != nullptr || unknownKeys != UnknownKeyAction::ignore)
            {
                Map unknown;

                for (auto const& entry : *map)
                    if (! (entry.key.isString() && knownKeys->contains(entry.key.as<std::string>())))
                        unknown.insertOrAssign(entry.key, entry.value);

                if (catchAll != nullptr)
                {
                    catchAll->fragment.load(Value(std::move(unknown)), meta.field(target, catchAll->index));
                }
                else if (! unknown.empty())
                {
                    std::vector<std::string> names;

                    for (auto const& entry : unknown)
                        names.push_back(entry.key.toText());

                    std::vector<std::string> fieldNames;

                    for (auto const& plan : *plans)
                        fieldNames.push_back(plan.name);

                    if (unknownKeys == UnknownKeyAction::raise)
                        report(Error(ErrorKind::unknownKey, std::format("unknown keys [{}] not mapped to any of the fields [{}]",
                                                                        joinQuoted(names), joinQuoted(fieldNames)), value),
                               collected);
                    else
                        log(LogLevel::warning, "Found {} unknown keys [{}] not mapped to {} (fields: [{}])",
                            names.size(), joinQuoted(names), recordName, joinQuoted(fieldNames));
                }
            }

            if (! errors.empty())
                throw Error::aggregate(std::move(errors));
        }
        catch (Error& e)
        {
            e.inRecord(recordName);
            throw;
        }
    };

    auto defaults = std::make_shared<DefaultDumps>();
    symbols.bind("defaults", defaults);

    auto dump = [&meta, plans, defaults, recordName, skipDefaults] (void const* source)
    {
        if (skipDefaults)
        {
            std::call_once(defaults->once, [&]
            {
                for (auto const& plan : *plans)
                    defaults->values.push_back(plan.hasDefault && (! plan.exclude)
                        ? std::optional<Value>(plan.fragment.dump(meta.field(meta.prototype(), plan.index)))
                        : std::nullopt);
            });
        }

        Value result = Map();
        auto& map = result.as<Map>();
        Value const* catchAll = nullptr;
        Value catchAllValue;

        for (std::size_t i = 0; i < plans->size(); ++i)
        {
            auto const& plan = (*plans)[i];

            if (plan.exclude)
                continue;

            Value dumped;

            try
            {
                dumped = plan.fragment.dump(meta.field(source, plan.index));
            }
            catch (Error& e)
            {
                e.prependField(plan.name);
                e.inRecord(recordName);
                throw;
            }

            if (plan.catchAll)
            {
                catchAllValue = std::move(dumped);
                catchAll = &catchAllValue;
                continue;
            }

            if (plan.skipIf.has_value() && (*plan.skipIf)(dumped))
                continue;

            if (skipDefaults && defaults->values[i].has_value() && dumped == *defaults->values[i])
                continue;

            plan.keys.dump.assign(result, std::move(dumped));
        }

        if (catchAll != nullptr && catchAll->isMap())
            for (auto const& entry : catchAll->as<Map>())
                if (map.find(entry.key) == nullptr)
                    map.insertOrAssign(entry.key, entry.value);

        return result;
    };

    return std::make_shared<Routine const>(meta, effective, std::move(symbols), std::move(load), std::move(dump), std::move(listing));
}

//=============================================================================
// Schema validation
//=============================================================================
namespace
{
class SchemaValidator
{
public:
    SchemaValidator(ExtensionRegistry const& extensions) : registry(extensions) {}

    void record(MetaType const& meta, Config const& inherited, bool callSite = false)
    {
        auto const& recordMeta = static_cast<RecordMeta const&>(meta);
        auto const effective = callSite ? Config::atCallSite(recordMeta.ownConfig(), inherited)
                                        : Config::merge(recordMeta.ownConfig(), inherited);
        auto const recordName = detail::unqualifiedName(meta.typeInfo());

        if (! visited.insert({ meta.typeIndex(), effective.fingerprint() }).second)
            return;

        stack.push_back(meta.typeIndex());
        auto popStack = detail::callAtEndOfScope([this] { stack.pop_back(); });

        auto const attribute = [&] (Error& e, std::string_view field)
        {
            e.prependField(field);
            e.inRecord(recordName);
            errors.push_back(std::move(e));
        };

        try
        {
            checkRecord(meta);
        }
        catch (Error& e)
        {
            e.inRecord(recordName);
            errors.push_back(std::move(e));
        }

        auto const nested = effective.propagates() ? effective : Config {};
        auto const fields = meta.fields();

        for (std::size_t i = 0; i < fields.size(); ++i)
        {
            try
            {
                auto const descriptor = resolveField(fields[i], i, effective, stack);
                auto const before = errors.size();

                descend(descriptor, effective, nested);

                for (auto it = errors.begin() + static_cast<std::ptrdiff_t>(before); it != errors.end(); ++it)
                {
                    it->prependField(fields[i].fieldname);
                    it->inRecord(recordName);
                }
            }
            catch (Error& e)
            {
                attribute(e, fields[i].fieldname);
            }
        }
    }

    void descend(TypeDescriptor const& descriptor, Config const& enclosing, Config const& nested)
    {
        if (registry.contains(descriptor.type->typeIndex()))
            return;

        switch (descriptor.kind)
        {
        case Kind::custom:
            if (descriptor.type->typeInfo() != typeid(std::monostate))
                errors.emplace_back(ErrorKind::unsupportedType,
                                    std::format("{} has no built-in handler and no registered extension", descriptor.type->name()));
            break;

        case Kind::record:
            if (! descriptor.recursive)
                record(*descriptor.type, nested);
            break;

        case Kind::sum:
        {
            std::vector<std::string> tags;

            for (auto const& argument : descriptor.arguments)
            {
                if (argument.inOptional())
                    continue;

                if (auto tag = tagOf(*argument.type, enclosing))
                {
                    if (std::find(tags.begin(), tags.end(), *tag) != tags.end())
                        errors.emplace_back(ErrorKind::descriptorResolution,
                                            std::format("tag \"{}\" is used by more than one alternative of {}", *tag, descriptor.type->name()));

                    tags.push_back(*tag);
                }
            }

            break;
        }

        default:
            break;
        }

        for (auto const& argument : descriptor.arguments)
            descend(argument, enclosing, nested);
    }

    std::vector<Error> errors;

private:
    ExtensionRegistry const& registry;
    CompileStack stack;
    std::set<std::pair<std::type_index, std::string>> visited;
};
}

std::vector<Error> validateSchema(MetaType const& type, Config const& inherited, ExtensionRegistry const& registry)
{
    SchemaValidator validator(registry);

    if (type.kind() == Kind::record)
    {
        validator.record(type, inherited, true);
        return std::move(validator.errors);
    }

    try
    {
        ResolveContext context;
        auto const descriptor = resolve(type, context);
        validator.descend(descriptor, inherited, inherited.propagates() ? inherited : Config {});
    }
    catch (Error& e)
    {
        validator.errors.push_back(std::move(e));
    }

    return std::move(validator.errors);
}
} // namespace marshal
