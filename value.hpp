#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marshal
{
class Value;
struct MapEntry;

/// The null alternative of a dynamic value
using Null = std::monostate;

/// An ordered list of dynamic values
using Sequence = std::vector<Value>;

//=============================================================================
// Map
//=============================================================================
/**
 * @brief Insertion-ordered map of dynamic values
 *
 * Keys are usually strings but any scalar Value is accepted, as produced by
 * format adapters that allow non-string keys. Lookup is linear which is the
 * right trade-off for the small maps records turn into. Equality ignores
 * the insertion order.
 */
class Map
{
public:
    using iterator = std::vector<MapEntry>::iterator;
    using const_iterator = std::vector<MapEntry>::const_iterator;

    Map();
    Map(std::initializer_list<MapEntry> entries);
    Map(Map const&);
    Map(Map&&) noexcept;
    ~Map();

    Map& operator=(Map const&);
    Map& operator=(Map&&) noexcept;

    /// Returns the value stored under key, or nullptr
    Value const* find(Value const& key) const;
    Value* find(Value const& key);

    /// Returns the value stored under a string key, or nullptr
    Value const* find(std::string_view key) const;
    Value* find(std::string_view key);

    Value const* find(char const* key) const        { return find(std::string_view(key)); }
    Value* find(char const* key)                    { return find(std::string_view(key)); }
    Value const* find(std::string const& key) const { return find(std::string_view(key)); }
    Value* find(std::string const& key)             { return find(std::string_view(key)); }

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Inserts or replaces, keeping the original position of an existing key
    Value& insertOrAssign(Value key, Value value);

    /// Returns the value under key, inserting null if it is absent
    Value& operator[](std::string_view key);

    bool erase(std::string_view key);

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    friend bool operator==(Map const& a, Map const& b);

private:
    std::vector<MapEntry> entries;
};

//=============================================================================
// Value
//=============================================================================
/**
 * @brief Generic dynamic value tree used at the conversion boundary
 *
 * This is the shape produced by any JSON/YAML/TOML-like parser: null,
 * booleans, 64-bit integers, doubles, strings, sequences and maps. load()
 * consumes it and dump() produces it; dump output only ever contains
 * these alternatives.
 *
 * @code
 * Value v = Map { { "name", "sensor" }, { "tags", Sequence { "a", "b" } } };
 * if (auto const* name = v.getIf<Map>()->find("name"))
 *     std::cout << *name << std::endl;
 * @endcode
 */
class Value
{
public:
    using Storage = std::variant<Null, bool, std::int64_t, double, std::string, Sequence, Map>;

    /// The alternatives a Value may hold
    enum class Type { null, boolean, integer, floating, string, sequence, map };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(Null) {}
    Value(bool b) : storage(b) {}
    Value(double d) : storage(d) {}
    Value(float f) : storage(static_cast<double>(f)) {}
    Value(char const* s) : storage(std::string(s)) {}
    Value(std::string s) : storage(std::move(s)) {}
    Value(std::string_view s) : storage(std::string(s)) {}
    Value(Sequence s) : storage(std::move(s)) {}
    Value(Map m) : storage(std::move(m)) {}

    template <std::integral I>
        requires (! std::same_as<I, bool>)
    Value(I i) : storage(static_cast<std::int64_t>(i)) {}

    Type type() const noexcept { return static_cast<Type>(storage.index()); }

    /// Human readable name of the held alternative ("null", "integer", ...)
    std::string_view typeName() const noexcept;

    bool isNull() const noexcept      { return type() == Type::null; }
    bool isBool() const noexcept      { return type() == Type::boolean; }
    bool isInteger() const noexcept   { return type() == Type::integer; }
    bool isFloating() const noexcept  { return type() == Type::floating; }
    bool isNumber() const noexcept    { return isInteger() || isFloating(); }
    bool isString() const noexcept    { return type() == Type::string; }
    bool isSequence() const noexcept  { return type() == Type::sequence; }
    bool isMap() const noexcept       { return type() == Type::map; }
    bool isScalar() const noexcept    { return (! isSequence()) && (! isMap()); }

    template <typename T> bool is() const noexcept { return std::holds_alternative<T>(storage); }

    /// Returns the held alternative, throws std::bad_variant_access on mismatch
    template <typename T> decltype(auto) as(this auto&& self) { return std::get<T>(std::forward<decltype(self)>(self).storage); }

    template <typename T> auto getIf(this auto& self) noexcept { return std::get_if<T>(&self.storage); }

    /// Calls lambda with the held alternative
    template <typename Lambda>
    decltype(auto) visit(this auto&& self, Lambda && lambda) { return std::visit(std::forward<Lambda>(lambda), std::forward<decltype(self)>(self).storage); }

    /// Numeric value of an integer or floating value
    double toDouble() const;

    /**
     * @brief Truthiness as used by skip conditions
     *
     * null, false, 0, 0.0 and empty strings, sequences and maps are falsy.
     */
    bool truthy() const noexcept;

    /**
     * @brief Canonical text of a scalar
     *
     * Strings are returned verbatim, integers in decimal, doubles in their
     * shortest round-trip form, booleans as "true"/"false" and null as "null".
     * Containers are rendered like repr() does.
     */
    std::string toText() const;

    /// JSON-like rendering used by diagnostics and operator<<
    std::string repr() const;

    friend bool operator==(Value const& a, Value const& b);

    /// Numbers compare numerically, strings lexicographically, everything else is unordered
    friend std::partial_ordering operator<=>(Value const& a, Value const& b);

private:
    Storage storage;
};

/// A key/value pair stored in a Map
struct MapEntry
{
    Value key;
    Value value;
};

/// Name of a Value alternative ("null", "integer", ...)
std::string_view typeName(Value::Type t) noexcept;

std::ostream& operator<<(std::ostream& o, Value const& v);
std::ostream& operator<<(std::ostream& o, Value::Type t);

} // namespace marshal

// std::formatter specializations
template <>
struct std::formatter<marshal::Value> : std::formatter<std::string>
{
    auto format(marshal::Value const& v, format_context& ctx) const
    {
        return std::formatter<std::string>::format(v.repr(), ctx);
    }
};
