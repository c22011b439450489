/**
 * @file marshal.hpp
 * @brief Type-directed conversion between C++ records and dynamic Value trees
 *
 * Records are plain aggregates whose members are wrapped in Field<T, Name>.
 * The first conversion of a record type compiles a routine (resolving every
 * field type, computing its keys and picking a handler per kind) that is
 * cached and reused by every later conversion.
 *
 * Usage example:
 *   struct Point {
 *       Field<float, "x"> x;
 *       Field<float, "y"> y = 0.0f;     // optional on load
 *   };
 *
 *   auto p = marshal::load<Point>(Map { { "x", 1.5 } });
 *   Value v = marshal::dump(p);         // {"x": 1.5, "y": 0.0}
 */

#pragma once

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "fixed_string.hpp"
#include "marshal_detail.hpp"
#include "aliases.hpp"
#include "assembler.hpp"
#include "cache.hpp"
#include "coercion.hpp"
#include "config.hpp"
#include "descriptor.hpp"
#include "errors.hpp"
#include "handlers.hpp"
#include "logging.hpp"
#include "meta.hpp"
#include "registry.hpp"
#include "union_dispatch.hpp"
#include "value.hpp"

namespace marshal
{

//=============================================================================
// Field annotations
//=============================================================================

/// Extra flat keys a field is loaded from, tried before the field name
template <fixstr::fixed_string... Keys>
struct alias
{
    static void apply(FieldOptions& options) { (options.loadAliases.emplace_back(std::string(std::string_view(Keys))), ...); }
};

/// Nested paths such as "data.items[0].id" a field is loaded from
template <fixstr::fixed_string... Paths>
struct path
{
    static void apply(FieldOptions& options) { (options.loadAliases.push_back(KeyPath::parse(std::string_view(Paths))), ...); }
};

/// Flat key written on dump
template <fixstr::fixed_string Key>
struct dump_alias
{
    static void apply(FieldOptions& options) { options.dumpAlias = KeyPath(std::string(std::string_view(Key))); }
};

/// Nested path written on dump
template <fixstr::fixed_string Path>
struct dump_path
{
    static void apply(FieldOptions& options) { options.dumpAlias = KeyPath::parse(std::string_view(Path)); }
};

/// std::chrono::parse formats tried after ISO 8601
template <fixstr::fixed_string... Patterns>
struct pattern
{
    static void apply(FieldOptions& options) { (options.patterns.emplace_back(std::string_view(Patterns)), ...); }
};

/// The field receives every key of the input map not claimed by another field
struct catch_all     { static void apply(FieldOptions& options) { options.catchAll = true; } };

/// The field is loaded but never dumped
struct exclude       { static void apply(FieldOptions& options) { options.exclude = true; } };

struct skip_if_null  { static void apply(FieldOptions& options) { options.skipIf = Condition::isNull(); } };
struct skip_if_falsy { static void apply(FieldOptions& options) { options.skipIf = Condition::isFalsy(); } };

/**
 * @brief Attaches marshalling metadata to the declared type of a field
 *
 * Only valid as the first template argument of Field: the field stores a
 * plain T while the annotations end up in the field's FieldOptions.
 *
 * @code
 * struct Event
 * {
 *     Field<Annotated<std::string, alias<"eventName", "name">>, "event_name"> eventName;
 *     Field<Annotated<Instant, pattern<"%d/%m/%Y %H:%M">>, "at"> at;
 * };
 * @endcode
 */
template <typename T, typename... Annotations>
struct Annotated
{
    using type = T;

    static FieldOptions options()
    {
        FieldOptions result;
        (Annotations::apply(result), ...);
        return result;
    }
};

//=============================================================================
// Field
//=============================================================================
/**
 * @brief A named member of a record
 *
 * Field<T, Name> stores a T and carries its name at compile time. A field
 * initialised in its declaration is optional on load: its initial value
 * is kept when no candidate key is present. Fields of optional-like types
 * are always optional on load.
 *
 * @tparam T The stored type, or Annotated<T, ...>
 * @tparam Name The field name, used to derive its keys
 */
template <typename T, fixstr::fixed_string Name>
class Field
{
public:
    using declared_type = T;
    using value_type = detail::unannotated_t<T>;

    Field() = default;

    /// Initialises the field and marks it as having a default
    Field(value_type value) : underlying(std::move(value)), defaulted(true) {}

    Field& operator=(value_type const& value) { underlying = value; return *this; }
    Field& operator=(value_type && value)     { underlying = std::move(value); return *this; }

    value_type& operator()()                  { return underlying; }
    value_type const& operator()() const      { return underlying; }

    value_type* operator->()                  { return &underlying; }
    value_type const* operator->() const      { return &underlying; }

    /// Returns the compile-time field name as specified in the template parameter
    static constexpr std::string_view fieldname() { return Name; }

    /// True if the field was given a value on construction
    bool hasDefault() const noexcept          { return defaulted; }

    friend bool operator==(Field const& a, Field const& b) { return a.underlying == b.underlying; }

private:
    value_type underlying {};
    bool defaulted = false;
};

//=============================================================================
// Public API
//=============================================================================

/**
 * @brief The compiled routine of T under config
 *
 * Compiles on first use and caches the result per effective configuration.
 * config addresses T itself: its fields, tag and recursive options apply
 * to T while nested records only inherit the other options.
 *
 * @throws Error ErrorKind::descriptorResolution or ErrorKind::unsupportedType
 */
template <typename T>
std::shared_ptr<Routine const> compile(Config const& config = {}, RoutineCache& cache = RoutineCache::global());

/**
 * @brief Converts a dynamic value into a T
 *
 * @throws Error attributed with the record and field path of the failure
 */
template <typename T>
T load(Value const& value, Config const& config = {});

/// Converts a dynamic value into an existing object
template <typename T>
void loadInto(Value const& value, T& target, Config const& config = {});

/// Converts an object into a dynamic value
template <typename T>
Value dump(T const& object, Config const& config = {});

/**
 * @brief Collects every schema problem of T without compiling it
 *
 * Unlike compile(), which stops at the first problem, every record
 * reachable from T is checked and each problem is returned.
 */
template <typename T>
std::vector<Error> validateSchema(Config const& config = {});

/**
 * @brief Registers conversions for a type without built-in handling
 *
 * A missing load conversion defaults to constructing T from the loaded
 * string, a missing dump conversion to formatting T with operator<<.
 * Routines compiled before the registration are not affected.
 *
 * @code
 * marshal::registerType<Color>([] (Value const& v) { return Color::fromHex(v.toText()); },
 *                              [] (Color const& c) { return Value(c.toHex()); });
 * @endcode
 */
template <typename T>
void registerType(std::function<T(Value const&)> load = {}, std::function<Value(T const&)> dump = {});

/// Registers code generating hooks for T
template <typename T>
void registerTypeHooks(FragmentHook load, FragmentHook dump);

template <typename T>
bool unregisterType();

} // namespace marshal

#include "marshal.tpp"
