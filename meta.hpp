#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <vector>
#include "config.hpp"
#include "value.hpp"

namespace marshal
{

//=============================================================================
// Origin kinds
//=============================================================================

/// The origin kind of a type; one dispatch table handler exists per kind
enum class Kind
{
    any,            ///< marshal::Value, passed through unchanged
    boolean,
    integer,
    floating,
    string,         ///< std::string, std::filesystem::path
    bytes,          ///< std::vector<std::byte>, base64 encoded
    enumeration,    ///< enums exposing enumMembers()
    dateTime,       ///< std::chrono::sys_time<D>
    date,           ///< std::chrono::year_month_day
    time,           ///< std::chrono::hh_mm_ss<D>, a time of day
    duration,       ///< std::chrono::duration<R, P>
    sequence,       ///< std::vector, std::deque, std::list
    set,            ///< std::set, std::unordered_set
    fixedTuple,     ///< std::tuple, std::pair, std::array
    namedTuple,     ///< aggregates without Field<> members
    mapping,        ///< std::map, std::unordered_map
    record,         ///< aggregates with Field<> members
    sum,            ///< std::variant
    optional,       ///< std::optional, std::unique_ptr, std::shared_ptr
    custom          ///< anything else; needs an extension registry entry
};

inline constexpr std::size_t kNumKinds = static_cast<std::size_t>(Kind::custom) + 1;

std::string_view toString(Kind kind) noexcept;

class MetaType;

/// Lazily obtains a MetaType; keeps recursive type graphs free of initialisation order issues
using MetaTypeRef = MetaType const& (*)();

/**
 * @brief Describes a single field within a record's MetaType
 *
 * Provides the field name, a function pointer to lazily obtain the
 * MetaType of the field's storage type and, for Field<Annotated<...>>
 * members, a function producing the options carried by the annotations.
 */
struct FieldDescriptor
{
    std::string_view fieldname;
    MetaTypeRef metaType;
    FieldOptions (*annotations)() = nullptr;
};

//=============================================================================
// MetaType system
//=============================================================================
/**
 * @brief Type-erased description of a C++ type the compiler can handle
 *
 * There is one MetaType singleton per type, obtained with metaTypeOf<T>().
 * Each kind has an abstract subclass giving the dispatch table access to
 * values through void pointers, so that handlers are compiled once and
 * then run without any template instantiation per call site.
 *
 * @code
 * auto const& meta = metaTypeOf<Point>();
 * for (auto const& field : meta.fields())
 *     std::cout << field.fieldname << ": " << field.metaType().name() << std::endl;
 * @endcode
 */
class MetaType
{
public:
    virtual ~MetaType() = default;

    virtual Kind kind() const = 0;

    /// Returns the std::type_info for the underlying type
    virtual std::type_info const& typeInfo() const = 0;

    std::type_index typeIndex() const { return std::type_index(typeInfo()); }

    /// Readable type name used in diagnostics and as automatic union tag
    virtual std::string name() const;

    /// Fields of records and named tuples, empty otherwise
    virtual std::span<FieldDescriptor const> fields() const { return {}; }

    /// Type arguments: element, key and value, tuple elements or alternatives
    virtual std::span<MetaTypeRef const> arguments() const { return {}; }
};

class BooleanMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::boolean; }
    virtual void store(void* target, bool value) const = 0;
    virtual bool fetch(void const* source) const = 0;
};

class IntegerMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::integer; }

    /// Returns false if value is out of range for the target type
    virtual bool store(void* target, std::int64_t value) const = 0;

    /// Returns nullopt if the stored value does not fit into 64 signed bits
    virtual std::optional<std::int64_t> fetch(void const* source) const = 0;
};

class FloatingMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::floating; }
    virtual void store(void* target, double value) const = 0;
    virtual double fetch(void const* source) const = 0;
};

class StringMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::string; }
    virtual void store(void* target, std::string value) const = 0;
    virtual std::string fetch(void const* source) const = 0;
};

class BytesMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::bytes; }
    virtual void store(void* target, std::vector<std::byte> value) const = 0;
    virtual std::span<std::byte const> fetch(void const* source) const = 0;
};

/// One member of an enumeration as returned by enumMembers()
template <typename E>
struct EnumMember
{
    E member;
    std::string_view name;
    Value value;
};

class EnumerationMeta : public MetaType
{
public:
    struct Entry
    {
        std::string name;
        Value value;
        std::int64_t underlying;
    };

    Kind kind() const override { return Kind::enumeration; }
    virtual std::span<Entry const> members() const = 0;
    virtual void store(void* target, std::int64_t underlying) const = 0;
    virtual std::int64_t fetch(void const* source) const = 0;
};

/// Instants are exchanged in microseconds since the Unix epoch
using Instant = std::chrono::sys_time<std::chrono::microseconds>;

/// Times of day are exchanged in microseconds since midnight
using TimeOfDay = std::chrono::hh_mm_ss<std::chrono::microseconds>;

class DateTimeMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::dateTime; }
    virtual void store(void* target, Instant value) const = 0;
    virtual Instant fetch(void const* source) const = 0;
};

class DateMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::date; }
    virtual void store(void* target, std::chrono::year_month_day value) const = 0;
    virtual std::chrono::year_month_day fetch(void const* source) const = 0;
};

class TimeMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::time; }
    virtual void store(void* target, std::chrono::microseconds sinceMidnight) const = 0;
    virtual std::chrono::microseconds fetch(void const* source) const = 0;
};

class DurationMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::duration; }
    virtual void store(void* target, std::chrono::duration<double> seconds) const = 0;
    virtual std::chrono::duration<double> fetch(void const* source) const = 0;
};

/// Fills the element storage passed to it
using ElementFiller = std::function<void(void*)>;

/// Visits an element
using ElementVisitor = std::function<void(void const*)>;

/// Sequences and sets
class CollectionMeta : public MetaType
{
public:
    MetaType const& element() const { return arguments()[0](); }
    virtual void clear(void* target) const = 0;
    virtual void reserve(void* target, std::size_t n) const = 0;

    /// Constructs a default element, lets fill populate it, then appends/inserts it
    virtual void append(void* target, ElementFiller const& fill) const = 0;

    virtual std::size_t size(void const* source) const = 0;
    virtual void forEach(void const* source, ElementVisitor const& visit) const = 0;
};

/// Fixed-arity tuples and named tuples
class TupleMeta : public MetaType
{
public:
    std::size_t arity() const { return arguments().size(); }
    virtual void* at(void* target, std::size_t i) const = 0;
    virtual void const* at(void const* source, std::size_t i) const = 0;
};

class MappingMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::mapping; }

    MetaType const& key() const   { return arguments()[0](); }
    MetaType const& value() const { return arguments()[1](); }

    virtual void clear(void* target) const = 0;

    /// Constructs a default key and value, lets fill populate both, then inserts them
    virtual void insert(void* target, std::function<void(void* key, void* value)> const& fill) const = 0;

    virtual std::size_t size(void const* source) const = 0;
    virtual void forEach(void const* source, std::function<void(void const* key, void const* value)> const& visit) const = 0;
};

class OptionalMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::optional; }

    MetaType const& element() const { return arguments()[0](); }

    virtual bool engaged(void const* source) const = 0;
    virtual void reset(void* target) const = 0;

    /// Engages the optional with a default constructed element and returns it
    virtual void* emplace(void* target) const = 0;
    virtual void const* get(void const* source) const = 0;
};

class SumMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::sum; }

    virtual std::size_t index(void const* source) const = 0;

    /// Switches to alternative i, default constructed, and returns it
    virtual void* emplace(void* target, std::size_t i) const = 0;
    virtual void const* get(void const* source, std::size_t i) const = 0;

    /// Index of the std::monostate alternative, if any
    virtual std::optional<std::size_t> nullAlternative() const = 0;
};

class RecordMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::record; }

    /// Resets target to a default constructed record
    virtual void reset(void* target) const = 0;

    virtual void* field(void* target, std::size_t i) const = 0;
    virtual void const* field(void const* source, std::size_t i) const = 0;

    /// True if field i is initialised by a default member initializer
    virtual bool hasDefault(std::size_t i) const = 0;

    /// A default constructed record, used to dump field defaults
    virtual void const* prototype() const = 0;

    /// The configuration the record declares for itself
    virtual Config ownConfig() const = 0;
};

class AnyMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::any; }
    std::type_info const& typeInfo() const override { return typeid(Value); }
    std::string name() const override { return "Value"; }
};

/// Types without a built-in handler
class CustomMeta : public MetaType
{
public:
    Kind kind() const override { return Kind::custom; }
};

/**
 * @brief Get the MetaType for a given C++ type T
 *
 * Maps any type to its MetaType singleton:
 *   - Value -> AnyMeta
 *   - bool, integers, floating points, strings, byte vectors -> scalar metas
 *   - enums with enumMembers(), chrono time points, dates and durations
 *   - optional-like, variants, sequences, sets, maps and tuples
 *   - aggregates with Field<> members -> RecordMeta
 *   - other aggregates -> TupleMeta (named tuple)
 *   - anything else -> CustomMeta
 *
 * @tparam T The type to get metadata for
 * @return Reference to the MetaType singleton for T
 */
template <typename T>
MetaType const& metaTypeOf();

} // namespace marshal
