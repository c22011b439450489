#include "handlers.hpp"
#include <algorithm>
#include <format>
#include "assembler.hpp"
#include "cache.hpp"
#include "coercion.hpp"
#include "errors.hpp"
#include "marshal_detail.hpp"
#include "registry.hpp"
#include "union_dispatch.hpp"

namespace marshal
{
//=============================================================================
// CompileContext
//=============================================================================
CompileContext::CompileContext(RoutineCache& cache, ExtensionRegistry const& registry, Config const& config,
                               SymbolTable& symbols, CompileStack& stack)
    : routineCache(cache), extensions(registry), effective(config), symbolTable(symbols), compileStack(stack)
{}

Config CompileContext::nestedConfig() const
{
    return effective.propagates() ? effective : Config {};
}

namespace
{
Fragment fromExtension(ExtensionEntry const& entry, TypeDescriptor const& descriptor, CompileContext& context)
{
    Fragment fragment { descriptor.binding(), {}, {} };
    auto const typeName = descriptor.type->name();

    std::visit(detail::multilambda
    {
        [&] (std::monostate)
        {
            fragment.load = [typeName] (Value const& value, void*)
            {
                throw Error(ErrorKind::unsupportedType, std::format("no load conversion registered for {}", typeName), value);
            };
        },
        [&] (LoadHook const& hook)
        {
            fragment.load = [hook, typeName] (Value const& value, void* target)
            {
                try
                {
                    hook(value, target);
                }
                catch (Error const&)
                {
                    throw;
                }
                catch (std::exception const& e)
                {
                    throw Error(ErrorKind::typeMismatch, std::format("cannot convert {} to {}: {}", value.repr(), typeName, e.what()), value);
                }
            };
        },
        [&] (FragmentHook const& hook) { fragment.load = hook(descriptor, context).load; }
    }, entry.load);

    std::visit(detail::multilambda
    {
        [&] (std::monostate)
        {
            fragment.dump = [typeName] (void const*) -> Value
            {
                throw Error(ErrorKind::unsupportedType, std::format("no dump conversion registered for {}", typeName));
            };
        },
        [&] (DumpHook const& hook) { fragment.dump = hook; },
        [&] (FragmentHook const& hook) { fragment.dump = hook(descriptor, context).dump; }
    }, entry.dump);

    context.symbols().bind("extension_" + descriptor.binding(), std::make_shared<ExtensionEntry>(entry));
    return fragment;
}
}

Fragment CompileContext::emit(TypeDescriptor const& descriptor)
{
    if (descriptor.inOptional())
        return HandlerTable::instance().emit(Kind::optional, descriptor, *this);

    if (auto entry = extensions.find(descriptor.type->typeIndex()))
        return fromExtension(*entry, descriptor, *this);

    return HandlerTable::instance().emit(descriptor.kind, descriptor, *this);
}

//=============================================================================
// Handlers
//=============================================================================
namespace
{
Fragment anyHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    return
    {
        descriptor.binding(),
        [] (Value const& value, void* target) { *static_cast<Value*>(target) = value; },
        [] (void const* source) { return *static_cast<Value const*>(source); }
    };
}

Fragment booleanHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    auto const& meta = static_cast<BooleanMeta const&>(*descriptor.type);

    return
    {
        descriptor.binding(),
        [&meta] (Value const& value, void* target) { meta.store(target, loadBool(value)); },
        [&meta] (void const* source) { return Value(meta.fetch(source)); }
    };
}

Fragment integerHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<IntegerMeta const&>(*descriptor.type);
    auto const policy = context.config().fractionalIntegers.value_or(FractionalIntegers::round);

    return
    {
        descriptor.binding(),
        [&meta, policy] (Value const& value, void* target)
        {
            if (! meta.store(target, loadInteger(value, policy)))
                throw Error(ErrorKind::typeMismatch, std::format("{} is out of range for {}", value.repr(), meta.name()), value);
        },
        [&meta] (void const* source)
        {
            auto const integer = meta.fetch(source);

            if (! integer.has_value())
                throw Error(ErrorKind::typeMismatch, std::format("{} value does not fit into a 64 bit signed integer", meta.name()));

            return Value(*integer);
        }
    };
}

Fragment floatingHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    auto const& meta = static_cast<FloatingMeta const&>(*descriptor.type);

    return
    {
        descriptor.binding(),
        [&meta] (Value const& value, void* target) { meta.store(target, loadFloat(value)); },
        [&meta] (void const* source) { return Value(meta.fetch(source)); }
    };
}

Fragment stringHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    auto const& meta = static_cast<StringMeta const&>(*descriptor.type);

    return
    {
        descriptor.binding(),
        [&meta] (Value const& value, void* target) { meta.store(target, loadString(value)); },
        [&meta] (void const* source) { return Value(meta.fetch(source)); }
    };
}

Fragment bytesHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    auto const& meta = static_cast<BytesMeta const&>(*descriptor.type);

    return
    {
        descriptor.binding(),
        [&meta] (Value const& value, void* target) { meta.store(target, loadBytes(value)); },
        [&meta] (void const* source) { return Value(encodeBase64(meta.fetch(source))); }
    };
}

Fragment enumerationHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    using Entry = EnumerationMeta::Entry;

    auto const& meta = static_cast<EnumerationMeta const&>(*descriptor.type);
    auto const byName = context.config().enumMatch.value_or(EnumMatch::byValue) == EnumMatch::byName;
    auto const keyText = descriptor.mapKey;
    auto const members = meta.members();
    auto const table = context.symbols().bind("enum_" + descriptor.binding(),
                                              std::make_shared<std::vector<Entry>>(members.begin(), members.end()));

    std::string allowed;

    for (auto const& entry : *table)
        allowed += (allowed.empty() ? "" : ", ") + (byName ? Value(entry.name).repr() : entry.value.repr());

    return
    {
        descriptor.binding(),
        [&meta, table, byName, keyText, allowed] (Value const& value, void* target)
        {
            auto const match = std::find_if(table->begin(), table->end(), [&] (Entry const& entry)
            {
                if (byName)
                    return value.isString() && value.as<std::string>() == entry.name;

                if (value.type() == entry.value.type())
                    return value == entry.value;

                // map keys were dumped through canonicalKey()
                return keyText && value.isString() && entry.value.isScalar() && (! entry.value.isNull())
                    && value.as<std::string>() == canonicalKey(entry.value);
            });

            if (match == table->end())
                throw Error(ErrorKind::typeMismatch,
                            std::format("{} is not a valid {}; allowed: {}", value.repr(), meta.name(), allowed), value);

            meta.store(target, match->underlying);
        },
        [&meta, table, byName] (void const* source)
        {
            auto const underlying = meta.fetch(source);
            auto const match = std::find_if(table->begin(), table->end(), [underlying] (Entry const& entry) { return entry.underlying == underlying; });

            if (match == table->end())
                throw Error(ErrorKind::typeMismatch, std::format("{} holds the undeclared value {}", meta.name(), underlying));

            return byName ? Value(match->name) : match->value;
        }
    };
}

Fragment dateTimeHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<DateTimeMeta const&>(*descriptor.type);
    auto const output = context.config().dateTimeOutput.value_or(DateTimeOutput::iso);
    auto const patterns = context.symbols().bind("patterns_" + descriptor.binding(),
                                                 std::make_shared<std::vector<std::string>>(descriptor.annotations.patterns));

    return
    {
        descriptor.binding(),
        [&meta, patterns] (Value const& value, void* target) { meta.store(target, loadDateTime(value, *patterns)); },
        [&meta, output] (void const* source) { return dumpDateTime(meta.fetch(source), output); }
    };
}

Fragment dateHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<DateMeta const&>(*descriptor.type);
    auto const output = context.config().dateTimeOutput.value_or(DateTimeOutput::iso);
    auto const patterns = context.symbols().bind("patterns_" + descriptor.binding(),
                                                 std::make_shared<std::vector<std::string>>(descriptor.annotations.patterns));

    return
    {
        descriptor.binding(),
        [&meta, patterns] (Value const& value, void* target) { meta.store(target, loadDate(value, *patterns)); },
        [&meta, output] (void const* source) { return dumpDate(meta.fetch(source), output); }
    };
}

Fragment timeHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    auto const& meta = static_cast<TimeMeta const&>(*descriptor.type);

    return
    {
        descriptor.binding(),
        [&meta] (Value const& value, void* target) { meta.store(target, loadTime(value)); },
        [&meta] (void const* source) { return dumpTime(meta.fetch(source)); }
    };
}

Fragment durationHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    auto const& meta = static_cast<DurationMeta const&>(*descriptor.type);

    return
    {
        descriptor.binding(),
        [&meta] (Value const& value, void* target) { meta.store(target, loadDuration(value)); },
        [&meta] (void const* source) { return dumpDuration(meta.fetch(source)); }
    };
}

Sequence const& requireSequence(Value const& value, std::string_view expected)
{
    auto const* sequence = value.getIf<Sequence>();

    if (sequence == nullptr)
        throw typeMismatch(expected, value);

    return *sequence;
}

Fragment collectionHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<CollectionMeta const&>(*descriptor.type);
    auto const element = context.emit(descriptor.arguments[0]);
    auto const expected = std::string(toString(descriptor.kind));

    return
    {
        descriptor.binding(),
        [&meta, element, expected] (Value const& value, void* target)
        {
            auto const& sequence = requireSequence(value, expected);
            meta.clear(target);
            meta.reserve(target, sequence.size());

            for (std::size_t i = 0; i < sequence.size(); ++i)
            {
                try
                {
                    meta.append(target, [&] (void* storage) { element.load(sequence[i], storage); });
                }
                catch (Error& e)
                {
                    e.prependIndex(i);
                    throw;
                }
            }
        },
        [&meta, element] (void const* source)
        {
            Sequence result;
            result.reserve(meta.size(source));

            meta.forEach(source, [&] (void const* storage)
            {
                try
                {
                    result.push_back(element.dump(storage));
                }
                catch (Error& e)
                {
                    e.prependIndex(result.size());
                    throw;
                }
            });

            return Value(std::move(result));
        }
    };
}

std::vector<Fragment> emitArguments(TypeDescriptor const& descriptor, CompileContext& context)
{
    std::vector<Fragment> fragments;

    for (auto const& argument : descriptor.arguments)
        fragments.push_back(context.emit(argument));

    return fragments;
}

void loadPositional(TupleMeta const& meta, std::vector<Fragment> const& elements, Sequence const& sequence, Value const& value, void* target)
{
    if (sequence.size() != elements.size())
        throw Error(ErrorKind::lengthMismatch,
                    std::format("{} expects {} elements, got {}", meta.name(), elements.size(), sequence.size()), value);

    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        try
        {
            elements[i].load(sequence[i], meta.at(target, i));
        }
        catch (Error& e)
        {
            e.prependIndex(i);
            throw;
        }
    }
}

Sequence dumpPositional(TupleMeta const& meta, std::vector<Fragment> const& elements, void const* source)
{
    Sequence result;

    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        try
        {
            result.push_back(elements[i].dump(meta.at(source, i)));
        }
        catch (Error& e)
        {
            e.prependIndex(i);
            throw;
        }
    }

    return result;
}

Fragment fixedTupleHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<TupleMeta const&>(*descriptor.type);
    auto const elements = emitArguments(descriptor, context);

    return
    {
        descriptor.binding(),
        [&meta, elements] (Value const& value, void* target)
        {
            loadPositional(meta, elements, requireSequence(value, "tuple"), value, target);
        },
        [&meta, elements] (void const* source) { return Value(dumpPositional(meta, elements, source)); }
    };
}

Fragment namedTupleHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<TupleMeta const&>(*descriptor.type);
    auto const elements = emitArguments(descriptor, context);
    auto const asMap = context.config().namedTupleAsMap.value_or(false);

    return
    {
        descriptor.binding(),
        [&meta, elements, asMap] (Value const& value, void* target)
        {
            if (auto const* sequence = value.getIf<Sequence>())
                return loadPositional(meta, elements, *sequence, value, target);

            if (! (asMap && value.isMap()))
                throw typeMismatch(asMap ? "map or sequence" : "sequence", value);

            auto const fields = meta.fields();

            for (std::size_t i = 0; i < elements.size(); ++i)
            {
                auto const* entry = value.as<Map>().find(fields[i].fieldname);

                try
                {
                    if (entry == nullptr)
                        throw Error(ErrorKind::missingField, std::format("missing element \"{}\" of {}", fields[i].fieldname, meta.name()));

                    elements[i].load(*entry, meta.at(target, i));
                }
                catch (Error& e)
                {
                    e.prependField(fields[i].fieldname);
                    throw;
                }
            }
        },
        [&meta, elements, asMap] (void const* source)
        {
            if (! asMap)
                return Value(dumpPositional(meta, elements, source));

            auto const fields = meta.fields();
            Map result;

            for (std::size_t i = 0; i < elements.size(); ++i)
            {
                try
                {
                    result.insertOrAssign(fields[i].fieldname, elements[i].dump(meta.at(source, i)));
                }
                catch (Error& e)
                {
                    e.prependField(fields[i].fieldname);
                    throw;
                }
            }

            return Value(std::move(result));
        }
    };
}

Fragment mappingHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = static_cast<MappingMeta const&>(*descriptor.type);
    auto const key = context.emit(descriptor.arguments[0]);
    auto const element = context.emit(descriptor.arguments[1]);

    return
    {
        descriptor.binding(),
        [&meta, key, element] (Value const& value, void* target)
        {
            auto const* map = value.getIf<Map>();

            if (map == nullptr)
                throw typeMismatch("map", value);

            meta.clear(target);

            for (auto const& entry : *map)
            {
                try
                {
                    meta.insert(target, [&] (void* keyStorage, void* valueStorage)
                    {
                        key.load(entry.key, keyStorage);
                        element.load(entry.value, valueStorage);
                    });
                }
                catch (Error& e)
                {
                    e.prependKey(entry.key.toText());
                    throw;
                }
            }
        },
        [&meta, key, element] (void const* source)
        {
            Map result;

            meta.forEach(source, [&] (void const* keyStorage, void const* valueStorage)
            {
                auto text = canonicalKey(key.dump(keyStorage));

                try
                {
                    result.insertOrAssign(text, element.dump(valueStorage));
                }
                catch (Error& e)
                {
                    e.prependKey(text);
                    throw;
                }
            });

            return Value(std::move(result));
        }
    };
}

Fragment optionalHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& wrapper = *descriptor.optionals.front();

    auto inner = descriptor;
    inner.optionals.erase(inner.optionals.begin());
    auto const element = context.emit(inner);

    return
    {
        descriptor.binding(),
        [&wrapper, element] (Value const& value, void* target)
        {
            if (value.isNull())
                wrapper.reset(target);
            else
                element.load(value, wrapper.emplace(target));
        },
        [&wrapper, element] (void const* source)
        {
            return wrapper.engaged(source) ? element.dump(wrapper.get(source)) : Value();
        }
    };
}

Fragment recordHandler(TypeDescriptor const& descriptor, CompileContext& context)
{
    auto const& meta = *descriptor.type;
    auto nested = context.nestedConfig();

    if (descriptor.recursive)
    {
        auto const late = context.symbols().bind("late_" + descriptor.binding(),
                                                 std::make_shared<LateBoundRoutine>(context.cache(), meta, std::move(nested)));

        return
        {
            descriptor.binding(),
            [late] (Value const& value, void* target) { late->get().load(value, target); },
            [late] (void const* source) { return late->get().dump(source); }
        };
    }

    auto const routine = context.symbols().bind("routine_" + descriptor.binding(),
                                                context.cache().getOrCompile(meta, nested, context.stack()));

    return
    {
        descriptor.binding(),
        [routine] (Value const& value, void* target) { routine->load(value, target); },
        [routine] (void const* source) { return routine->dump(source); }
    };
}

Fragment customHandler(TypeDescriptor const& descriptor, CompileContext&)
{
    throw Error(ErrorKind::unsupportedType,
                std::format("{} has no built-in handler and no registered extension", descriptor.type->name()));
}
}

//=============================================================================
// HandlerTable
//=============================================================================
HandlerTable::HandlerTable()
{
    auto const set = [this] (Kind kind, Handler handler) { handlers[static_cast<std::size_t>(kind)] = handler; };

    set(Kind::any,         anyHandler);
    set(Kind::boolean,     booleanHandler);
    set(Kind::integer,     integerHandler);
    set(Kind::floating,    floatingHandler);
    set(Kind::string,      stringHandler);
    set(Kind::bytes,       bytesHandler);
    set(Kind::enumeration, enumerationHandler);
    set(Kind::dateTime,    dateTimeHandler);
    set(Kind::date,        dateHandler);
    set(Kind::time,        timeHandler);
    set(Kind::duration,    durationHandler);
    set(Kind::sequence,    collectionHandler);
    set(Kind::set,         collectionHandler);
    set(Kind::fixedTuple,  fixedTupleHandler);
    set(Kind::namedTuple,  namedTupleHandler);
    set(Kind::mapping,     mappingHandler);
    set(Kind::record,      recordHandler);
    set(Kind::sum,         emitSum);
    set(Kind::optional,    optionalHandler);
    set(Kind::custom,      customHandler);
}

HandlerTable const& HandlerTable::instance()
{
    static HandlerTable const table;
    return table;
}

Fragment HandlerTable::emit(Kind kind, TypeDescriptor const& descriptor, CompileContext& context) const
{
    return handlerFor(kind)(descriptor, context);
}

std::string canonicalKey(Value const& key)
{
    switch (key.type())
    {
    case Value::Type::string:
        return key.as<std::string>();

    case Value::Type::boolean:
    case Value::Type::integer:
    case Value::Type::floating:
        return key.toText();

    default:
        throw typeMismatch("scalar map key", key);
    }
}
} // namespace marshal
