#pragma once

namespace marshal
{
namespace detail
{

//=============================================================================
// Field annotations
//=============================================================================

/// The options function of a Field<Annotated<...>>, nullptr for other fields
template <typename F>
FieldOptions (*annotationsOf())()
{
    using Declared = typename F::declared_type;

    if constexpr (is_annotated<Declared>::value)
        return &Declared::options;
    else
        return nullptr;
}

//=============================================================================
// Scalar metas
//=============================================================================
class BooleanMetaImpl final : public BooleanMeta
{
public:
    std::type_info const& typeInfo() const override      { return typeid(bool); }
    void store(void* target, bool value) const override  { *static_cast<bool*>(target) = value; }
    bool fetch(void const* source) const override        { return *static_cast<bool const*>(source); }
};

template <typename T>
class IntegerMetaImpl final : public IntegerMeta
{
public:
    std::type_info const& typeInfo() const override { return typeid(T); }

    bool store(void* target, std::int64_t value) const override
    {
        static constexpr auto kMax = std::numeric_limits<T>::max();

        if constexpr (std::is_signed_v<T>)
        {
            if (value < static_cast<std::int64_t>(std::numeric_limits<T>::min()) || value > static_cast<std::int64_t>(kMax))
                return false;
        }
        else
        {
            if (value < 0 || static_cast<std::uint64_t>(value) > static_cast<std::uint64_t>(kMax))
                return false;
        }

        *static_cast<T*>(target) = static_cast<T>(value);
        return true;
    }

    std::optional<std::int64_t> fetch(void const* source) const override
    {
        auto const value = *static_cast<T const*>(source);

        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t))
        {
            if (value > static_cast<T>(std::numeric_limits<std::int64_t>::max()))
                return std::nullopt;
        }

        return static_cast<std::int64_t>(value);
    }
};

template <typename T>
class FloatingMetaImpl final : public FloatingMeta
{
public:
    std::type_info const& typeInfo() const override       { return typeid(T); }
    void store(void* target, double value) const override { *static_cast<T*>(target) = static_cast<T>(value); }
    double fetch(void const* source) const override       { return static_cast<double>(*static_cast<T const*>(source)); }
};

template <typename T>
class StringMetaImpl final : public StringMeta
{
public:
    std::type_info const& typeInfo() const override             { return typeid(T); }
    void store(void* target, std::string value) const override  { *static_cast<T*>(target) = T(std::move(value)); }

    std::string fetch(void const* source) const override
    {
        if constexpr (std::is_same_v<T, std::filesystem::path>)
            return static_cast<T const*>(source)->string();
        else
            return *static_cast<T const*>(source);
    }
};

class BytesMetaImpl final : public BytesMeta
{
public:
    std::type_info const& typeInfo() const override { return typeid(std::vector<std::byte>); }

    void store(void* target, std::vector<std::byte> value) const override
    {
        *static_cast<std::vector<std::byte>*>(target) = std::move(value);
    }

    std::span<std::byte const> fetch(void const* source) const override
    {
        return *static_cast<std::vector<std::byte> const*>(source);
    }
};

template <typename E>
class EnumerationMetaImpl final : public EnumerationMeta
{
public:
    std::type_info const& typeInfo() const override { return typeid(E); }

    std::span<Entry const> members() const override
    {
        static std::vector<Entry> const entries = []
        {
            std::vector<Entry> result;

            for (EnumMember<E> const& member : enumMembers(E {}))
                result.push_back({ std::string(member.name), member.value, static_cast<std::int64_t>(std::to_underlying(member.member)) });

            return result;
        }();

        return entries;
    }

    void store(void* target, std::int64_t underlying) const override
    {
        *static_cast<E*>(target) = static_cast<E>(underlying);
    }

    std::int64_t fetch(void const* source) const override
    {
        return static_cast<std::int64_t>(std::to_underlying(*static_cast<E const*>(source)));
    }
};

template <typename T>
class DateTimeMetaImpl final : public DateTimeMeta
{
public:
    using Duration = typename T::duration;

    std::type_info const& typeInfo() const override         { return typeid(T); }
    void store(void* target, Instant value) const override  { *static_cast<T*>(target) = std::chrono::floor<Duration>(value); }
    Instant fetch(void const* source) const override        { return std::chrono::floor<std::chrono::microseconds>(*static_cast<T const*>(source)); }
};

class DateMetaImpl final : public DateMeta
{
public:
    std::type_info const& typeInfo() const override { return typeid(std::chrono::year_month_day); }

    void store(void* target, std::chrono::year_month_day value) const override
    {
        *static_cast<std::chrono::year_month_day*>(target) = value;
    }

    std::chrono::year_month_day fetch(void const* source) const override
    {
        return *static_cast<std::chrono::year_month_day const*>(source);
    }
};

template <typename T>
class TimeMetaImpl final : public TimeMeta
{
public:
    using Precision = typename T::precision;

    std::type_info const& typeInfo() const override { return typeid(T); }

    void store(void* target, std::chrono::microseconds sinceMidnight) const override
    {
        *static_cast<T*>(target) = T(std::chrono::floor<Precision>(sinceMidnight));
    }

    std::chrono::microseconds fetch(void const* source) const override
    {
        return std::chrono::floor<std::chrono::microseconds>(static_cast<T const*>(source)->to_duration());
    }
};

template <typename T>
class DurationMetaImpl final : public DurationMeta
{
public:
    std::type_info const& typeInfo() const override { return typeid(T); }

    void store(void* target, std::chrono::duration<double> seconds) const override
    {
        if constexpr (std::chrono::treat_as_floating_point_v<typename T::rep>)
            *static_cast<T*>(target) = std::chrono::duration_cast<T>(seconds);
        else
            *static_cast<T*>(target) = std::chrono::round<T>(seconds);
    }

    std::chrono::duration<double> fetch(void const* source) const override
    {
        return std::chrono::duration<double>(*static_cast<T const*>(source));
    }
};

template <typename T>
class CustomMetaImpl final : public CustomMeta
{
public:
    std::type_info const& typeInfo() const override { return typeid(T); }
};

//=============================================================================
// Container metas
//=============================================================================
template <typename C>
class CollectionMetaImpl final : public CollectionMeta
{
public:
    using Element = typename C::value_type;

    Kind kind() const override                      { return is_set_like<C> ? Kind::set : Kind::sequence; }
    std::type_info const& typeInfo() const override { return typeid(C); }

    std::span<MetaTypeRef const> arguments() const override
    {
        static std::array<MetaTypeRef const, 1> const args { &metaTypeOf<Element> };
        return args;
    }

    void clear(void* target) const override { static_cast<C*>(target)->clear(); }

    void reserve(void* target, std::size_t n) const override
    {
        if constexpr (requires (C& c) { c.reserve(n); })
            static_cast<C*>(target)->reserve(n);
    }

    void append(void* target, ElementFiller const& fill) const override
    {
        Element element {};
        fill(&element);

        if constexpr (is_set_like<C>)
            static_cast<C*>(target)->insert(std::move(element));
        else
            static_cast<C*>(target)->push_back(std::move(element));
    }

    std::size_t size(void const* source) const override { return static_cast<C const*>(source)->size(); }

    void forEach(void const* source, ElementVisitor const& visit) const override
    {
        for (auto const& element : *static_cast<C const*>(source))
        {
            if constexpr (std::is_same_v<C, std::vector<bool>>)
            {
                bool const copy = element;
                visit(&copy);
            }
            else
            {
                visit(&element);
            }
        }
    }
};

template <typename T>
class TupleMetaImpl final : public TupleMeta
{
public:
    static constexpr auto kArity = std::tuple_size_v<T>;

    Kind kind() const override                      { return Kind::fixedTuple; }
    std::type_info const& typeInfo() const override { return typeid(T); }

    std::span<MetaTypeRef const> arguments() const override
    {
        static auto const args = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<MetaTypeRef const, kArity> { &metaTypeOf<std::tuple_element_t<Is, T>>... };
        }(std::make_index_sequence<kArity>());

        return args;
    }

    void* at(void* target, std::size_t i) const override
    {
        static auto const accessors = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<void* (*)(T&), kArity> { +[] (T& t) -> void* { return &std::get<Is>(t); }... };
        }(std::make_index_sequence<kArity>());

        return accessors[i](*static_cast<T*>(target));
    }

    void const* at(void const* source, std::size_t i) const override
    {
        return at(const_cast<void*>(source), i);
    }
};

template <typename T>
class NamedTupleMetaImpl final : public TupleMeta
{
public:
    static constexpr auto kArity = boost::pfr::tuple_size_v<T>;

    Kind kind() const override                      { return Kind::namedTuple; }
    std::type_info const& typeInfo() const override { return typeid(T); }
    std::string name() const override               { return unqualifiedName(typeid(T)); }

    std::span<FieldDescriptor const> fields() const override
    {
        static auto const descriptors = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<FieldDescriptor const, kArity>
            {
                FieldDescriptor { boost::pfr::get_name<Is, T>(), &metaTypeOf<boost::pfr::tuple_element_t<Is, T>> }...
            };
        }(std::make_index_sequence<kArity>());

        return descriptors;
    }

    std::span<MetaTypeRef const> arguments() const override
    {
        static auto const args = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<MetaTypeRef const, kArity> { &metaTypeOf<boost::pfr::tuple_element_t<Is, T>>... };
        }(std::make_index_sequence<kArity>());

        return args;
    }

    void* at(void* target, std::size_t i) const override
    {
        static auto const accessors = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<void* (*)(T&), kArity> { +[] (T& t) -> void* { return &boost::pfr::get<Is>(t); }... };
        }(std::make_index_sequence<kArity>());

        return accessors[i](*static_cast<T*>(target));
    }

    void const* at(void const* source, std::size_t i) const override
    {
        return at(const_cast<void*>(source), i);
    }
};

template <typename M>
class MappingMetaImpl final : public MappingMeta
{
public:
    using Key = typename M::key_type;
    using Mapped = typename M::mapped_type;

    std::type_info const& typeInfo() const override { return typeid(M); }

    std::span<MetaTypeRef const> arguments() const override
    {
        static std::array<MetaTypeRef const, 2> const args { &metaTypeOf<Key>, &metaTypeOf<Mapped> };
        return args;
    }

    void clear(void* target) const override { static_cast<M*>(target)->clear(); }

    void insert(void* target, std::function<void(void*, void*)> const& fill) const override
    {
        Key key {};
        Mapped mapped {};
        fill(&key, &mapped);
        static_cast<M*>(target)->insert_or_assign(std::move(key), std::move(mapped));
    }

    std::size_t size(void const* source) const override { return static_cast<M const*>(source)->size(); }

    void forEach(void const* source, std::function<void(void const*, void const*)> const& visit) const override
    {
        for (auto const& [key, mapped] : *static_cast<M const*>(source))
            visit(&key, &mapped);
    }
};

template <typename O> struct optional_element { using type = typename O::element_type; };
template <typename T> struct optional_element<std::optional<T>> { using type = T; };

template <typename O>
class OptionalMetaImpl final : public OptionalMeta
{
public:
    using Element = typename optional_element<O>::type;

    std::type_info const& typeInfo() const override { return typeid(O); }

    std::span<MetaTypeRef const> arguments() const override
    {
        static std::array<MetaTypeRef const, 1> const args { &metaTypeOf<Element> };
        return args;
    }

    bool engaged(void const* source) const override { return static_cast<bool>(*static_cast<O const*>(source)); }
    void reset(void* target) const override         { static_cast<O*>(target)->reset(); }

    void* emplace(void* target) const override
    {
        auto& optional = *static_cast<O*>(target);

        if constexpr (is_specialization_of_v<O, std::optional>)
            return &optional.emplace();
        else if constexpr (is_specialization_of_v<O, std::unique_ptr>)
            optional = std::make_unique<Element>();
        else
            optional = std::make_shared<Element>();

        return optional.get();
    }

    void const* get(void const* source) const override { return &**static_cast<O const*>(source); }
};

template <typename V>
class SumMetaImpl;

template <typename... Ts>
class SumMetaImpl<std::variant<Ts...>> final : public SumMeta
{
public:
    using Variant = std::variant<Ts...>;
    static constexpr auto kSize = sizeof...(Ts);

    std::type_info const& typeInfo() const override { return typeid(Variant); }

    std::span<MetaTypeRef const> arguments() const override
    {
        static std::array<MetaTypeRef const, kSize> const args { &metaTypeOf<Ts>... };
        return args;
    }

    std::size_t index(void const* source) const override { return static_cast<Variant const*>(source)->index(); }

    void* emplace(void* target, std::size_t i) const override
    {
        static auto const emplacers = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<void* (*)(Variant&), kSize> { +[] (Variant& v) -> void* { return &v.template emplace<Is>(); }... };
        }(std::make_index_sequence<kSize>());

        return emplacers[i](*static_cast<Variant*>(target));
    }

    void const* get(void const* source, std::size_t i) const override
    {
        static auto const getters = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<void const* (*)(Variant const&), kSize> { +[] (Variant const& v) -> void const* { return &std::get<Is>(v); }... };
        }(std::make_index_sequence<kSize>());

        return getters[i](*static_cast<Variant const*>(source));
    }

    std::optional<std::size_t> nullAlternative() const override
    {
        static constexpr std::array<bool, kSize> kIsNull { std::is_same_v<Ts, std::monostate>... };

        for (std::size_t i = 0; i < kSize; ++i)
            if (kIsNull[i])
                return i;

        return std::nullopt;
    }
};

//=============================================================================
// Record meta
//=============================================================================
template <typename T>
class RecordMetaImpl final : public RecordMeta
{
public:
    using Fields = FieldTypes<T>;
    static constexpr auto kNumFields = std::tuple_size_v<Fields>;

    std::type_info const& typeInfo() const override { return typeid(T); }
    std::string name() const override               { return unqualifiedName(typeid(T)); }

    std::span<FieldDescriptor const> fields() const override
    {
        static std::array<FieldDescriptor const, kNumFields> const descriptors =
            std::invoke([] <typename... Types> (std::type_identity<std::tuple<Types...>>)
            {
                return std::array<FieldDescriptor const, kNumFields>
                {{
                    FieldDescriptor { Types::fieldname(), &metaTypeOf<typename Types::value_type>, annotationsOf<Types>() }...
                }};
            }, std::type_identity<Fields>());

        return descriptors;
    }

    void reset(void* target) const override { *static_cast<T*>(target) = T {}; }

    void* field(void* target, std::size_t i) const override
    {
        static auto const accessors = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            return std::array<void* (*)(T&), kNumFields> { +[] (T& t) -> void* { return &std::get<Is>(fieldMembers(t))(); }... };
        }(std::make_index_sequence<kNumFields>());

        return accessors[i](*static_cast<T*>(target));
    }

    void const* field(void const* source, std::size_t i) const override
    {
        return field(const_cast<void*>(source), i);
    }

    bool hasDefault(std::size_t i) const override
    {
        static auto const defaults = [] <std::size_t... Is> (std::index_sequence<Is...>)
        {
            T const& proto = prototypeInstance();

            return std::array<bool, kNumFields>
            {
                (std::get<Is>(fieldMembers(proto)).hasDefault()
                 || is_optional_like<typename std::tuple_element_t<Is, Fields>::value_type>)...
            };
        }(std::make_index_sequence<kNumFields>());

        return defaults[i];
    }

    void const* prototype() const override { return &prototypeInstance(); }

    Config ownConfig() const override
    {
        if constexpr (HasOwnConfig<T>)
            return T::marshalConfig();
        else
            return {};
    }

private:
    static T const& prototypeInstance()
    {
        static T const proto {};
        return proto;
    }
};

//=============================================================================
// Meta selection
//=============================================================================
template <typename T>
auto selectMeta()
{
    static_assert(! is_annotated<T>::value, "Annotated<> is only valid as the declared type of a Field");

    if constexpr (std::is_same_v<T, Value>)
        return std::type_identity<AnyMeta>();
    else if constexpr (is_optional_like<T>)
        return std::type_identity<OptionalMetaImpl<T>>();
    else if constexpr (is_specialization_of_v<T, std::variant>)
        return std::type_identity<SumMetaImpl<T>>();
    else if constexpr (std::is_same_v<T, bool>)
        return std::type_identity<BooleanMetaImpl>();
    else if constexpr (std::is_integral_v<T> && sizeof(T) <= sizeof(std::int64_t))
        return std::type_identity<IntegerMetaImpl<T>>();
    else if constexpr (std::is_floating_point_v<T>)
        return std::type_identity<FloatingMetaImpl<T>>();
    else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::filesystem::path>)
        return std::type_identity<StringMetaImpl<T>>();
    else if constexpr (std::is_same_v<T, std::vector<std::byte>>)
        return std::type_identity<BytesMetaImpl>();
    else if constexpr (EnumWithMembers<T>)
        return std::type_identity<EnumerationMetaImpl<T>>();
    else if constexpr (is_sys_time<T>::value)
        return std::type_identity<DateTimeMetaImpl<T>>();
    else if constexpr (std::is_same_v<T, std::chrono::year_month_day>)
        return std::type_identity<DateMetaImpl>();
    else if constexpr (is_time_of_day<T>::value)
        return std::type_identity<TimeMetaImpl<T>>();
    else if constexpr (is_duration<T>::value)
        return std::type_identity<DurationMetaImpl<T>>();
    else if constexpr (is_mapping_like<T>)
        return std::type_identity<MappingMetaImpl<T>>();
    else if constexpr (is_set_like<T> || is_sequence_like<T>)
        return std::type_identity<CollectionMetaImpl<T>>();
    else if constexpr (is_fixed_tuple_like<T>)
        return std::type_identity<TupleMetaImpl<T>>();
    else if constexpr (RecordLike<T>)
        return std::type_identity<RecordMetaImpl<T>>();
    else if constexpr (NamedTupleLike<T>)
        return std::type_identity<NamedTupleMetaImpl<T>>();
    else
        return std::type_identity<CustomMetaImpl<T>>();
}

template <typename T>
using MetaTypeFor = typename decltype(selectMeta<T>())::type;

} // namespace detail

//=============================================================================
// MetaType access
//=============================================================================
template <typename T>
MetaType const& metaTypeOf()
{
    static detail::MetaTypeFor<std::remove_cvref_t<T>> const instance;
    return instance;
}

//=============================================================================
// Public API implementations
//=============================================================================
template <typename T>
std::shared_ptr<Routine const> compile(Config const& config, RoutineCache& cache)
{
    return cache.getOrCompileForCall(metaTypeOf<T>(), config);
}

template <typename T>
T load(Value const& value, Config const& config)
{
    T result {};
    loadInto(value, result, config);
    return result;
}

template <typename T>
void loadInto(Value const& value, T& target, Config const& config)
{
    compile<T>(config)->load(value, &target);
}

template <typename T>
Value dump(T const& object, Config const& config)
{
    return compile<T>(config)->dump(&object);
}

template <typename T>
std::vector<Error> validateSchema(Config const& config)
{
    return validateSchema(metaTypeOf<T>(), config, ExtensionRegistry::global());
}

template <typename T>
void registerType(std::function<T(Value const&)> load, std::function<Value(T const&)> dump)
{
    ExtensionEntry entry;

    if (load)
        entry.load = LoadHook([load] (Value const& value, void* target) { *static_cast<T*>(target) = load(value); });
    else if constexpr (std::constructible_from<T, std::string>)
        entry.load = LoadHook([] (Value const& value, void* target) { *static_cast<T*>(target) = T(loadString(value)); });

    if (dump)
        entry.dump = DumpHook([dump] (void const* source) { return dump(*static_cast<T const*>(source)); });
    else if constexpr (requires (std::ostream& os, T const& t) { os << t; })
        entry.dump = DumpHook([] (void const* source)
        {
            std::ostringstream os;
            os << *static_cast<T const*>(source);
            return Value(os.str());
        });

    ExtensionRegistry::global().add(typeid(T), std::move(entry));
}

template <typename T>
void registerTypeHooks(FragmentHook load, FragmentHook dump)
{
    ExtensionRegistry::global().add(typeid(T), ExtensionEntry { std::move(load), std::move(dump) });
}

template <typename T>
bool unregisterType()
{
    return ExtensionRegistry::global().remove(typeid(T));
}

} // namespace marshal
