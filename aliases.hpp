#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "value.hpp"

namespace marshal
{
struct FieldOptions;
struct Config;

//=============================================================================
// Key casing
//=============================================================================

/// Key casing transforms applied to field names
enum class KeyCase
{
    none,        ///< field name used verbatim
    camel,       ///< myFieldName
    pascal,      ///< MyFieldName
    kebab,       ///< my-field-name
    snake,       ///< my_field_name
    automatic    ///< load only: try the verbatim name, then every other casing
};

std::string_view toString(KeyCase keyCase) noexcept;

std::string toCamelCase(std::string_view name);
std::string toPascalCase(std::string_view name);
std::string toKebabCase(std::string_view name);
std::string toSnakeCase(std::string_view name);

/// Applies a casing; none and automatic return the name unchanged
std::string applyKeyCase(KeyCase keyCase, std::string_view name);

//=============================================================================
// Key paths
//=============================================================================
/**
 * @brief A sequence of map keys and sequence indices addressing a nested value
 *
 * A flat alias is a path with a single key segment. Paths are parsed from
 * the notation "a.b[0].c", where bracketed segments are indices unless
 * quoted: a["x.y"] addresses the key "x.y" inside "a".
 */
class KeyPath
{
public:
    using Segment = std::variant<std::string, std::int64_t>;

    KeyPath() = default;
    KeyPath(std::string key);
    KeyPath(char const* key);
    KeyPath(std::initializer_list<Segment> segments);

    /// Parses path notation; throws Error(ErrorKind::descriptorResolution) on malformed input
    static KeyPath parse(std::string_view notation);

    std::vector<Segment> const& segments() const noexcept { return parts; }
    bool empty() const noexcept                            { return parts.empty(); }

    /// True for a path made of exactly one key
    bool isFlat() const noexcept;

    /// The first segment rendered as a map key
    std::string head() const;

    /// Renders the path back into its notation
    std::string toString() const;

    /// Looks up the addressed value, nullptr if any segment is absent
    Value const* lookup(Value const& root) const;

    /// Stores value at the path, creating intermediate maps and sequences
    void assign(Value& root, Value value) const;

    friend bool operator==(KeyPath const&, KeyPath const&) = default;

private:
    std::vector<Segment> parts;
};

//=============================================================================
// Per-field keys
//=============================================================================

/// The keys a field is read from on load (first match wins) and written to on dump
struct FieldKeys
{
    std::vector<KeyPath> load;
    KeyPath dump;
};

/**
 * @brief Computes the load candidates and the dump key of a field
 *
 * Load: explicit aliases in declaration order, then the name under
 * config.keyCasingLoad; with KeyCase::automatic the verbatim name followed
 * by camel, pascal, kebab and snake casing. Duplicates are dropped.
 *
 * Dump: the explicit dump alias, else the first explicit load alias, else
 * the name under config.keyCasingDump.
 */
FieldKeys resolveFieldKeys(std::string_view fieldName, FieldOptions const& options, Config const& config);

} // namespace marshal
