#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "aliases.hpp"
#include "value.hpp"

namespace marshal
{

//=============================================================================
// Skip conditions
//=============================================================================
/**
 * @brief Predicate evaluated on a field's dumped value before it is emitted
 *
 * @code
 * FieldOptions { .skipIf = Condition::eq(0) }   // omit the field when it dumps to 0
 * Config { .skipIf = Condition::isNull() }     // omit every null field of a record
 * @endcode
 */
class Condition
{
public:
    enum class Op { eq, ne, lt, le, gt, ge, isNull, isNotNull, isTruthy, isFalsy };

    static Condition eq(Value operand)  { return Condition(Op::eq, std::move(operand)); }
    static Condition ne(Value operand)  { return Condition(Op::ne, std::move(operand)); }
    static Condition lt(Value operand)  { return Condition(Op::lt, std::move(operand)); }
    static Condition le(Value operand)  { return Condition(Op::le, std::move(operand)); }
    static Condition gt(Value operand)  { return Condition(Op::gt, std::move(operand)); }
    static Condition ge(Value operand)  { return Condition(Op::ge, std::move(operand)); }
    static Condition isNull()           { return Condition(Op::isNull, {}); }
    static Condition isNotNull()        { return Condition(Op::isNotNull, {}); }
    static Condition isTruthy()         { return Condition(Op::isTruthy, {}); }
    static Condition isFalsy()          { return Condition(Op::isFalsy, {}); }

    Op op() const noexcept                  { return operation; }
    Value const& operand() const noexcept   { return rhs; }

    /// True if value satisfies the condition
    bool operator()(Value const& value) const;

    /// Readable form such as "== 0" or "is truthy", also used in fingerprints
    std::string describe() const;

    friend bool operator==(Condition const&, Condition const&) = default;

private:
    Condition(Op op, Value operand) : operation(op), rhs(std::move(operand)) {}

    Op operation;
    Value rhs;
};

//=============================================================================
// Per-field options
//=============================================================================

/// Marshalling metadata of one field, from Annotated<> wrappers or Config::fields
struct FieldOptions
{
    std::vector<KeyPath> loadAliases;       ///< candidate load keys or paths, first match wins
    std::optional<KeyPath> dumpAlias;       ///< key or path written on dump
    std::vector<std::string> patterns;      ///< custom date/time patterns, tried in order
    std::optional<Condition> skipIf;        ///< omit the field on dump when its value matches
    bool exclude = false;                   ///< never emitted on dump
    bool catchAll = false;                  ///< receives the unknown keys of the record

    /// Overlays every option that is set in higher on top of this
    void mergeFrom(FieldOptions const& higher);

    std::string fingerprint() const;

    friend bool operator==(FieldOptions const&, FieldOptions const&) = default;
};

//=============================================================================
// Configuration
//=============================================================================

enum class UnknownKeyAction { ignore, warn, raise };
enum class DateTimeOutput { iso, timestamp };
enum class EnumMatch { byValue, byName };
enum class FractionalIntegers { round, reject };

std::string_view toString(UnknownKeyAction action) noexcept;
std::string_view toString(DateTimeOutput output) noexcept;
std::string_view toString(EnumMatch match) noexcept;
std::string_view toString(FractionalIntegers policy) noexcept;

/**
 * @brief Marshalling configuration of a record
 *
 * Every option is optional: an unset option is inherited from the enclosing
 * record (or the Config passed to load()/dump()), falling back to the
 * library default. A record declares its own configuration with a static
 * member function:
 *
 * @code
 * struct Event
 * {
 *     Field<std::string, "event_name"> eventName;
 *
 *     static marshal::Config marshalConfig()
 *     {
 *         return { .keyCasingLoad = KeyCase::automatic, .onUnknownKey = UnknownKeyAction::raise };
 *     }
 * };
 * @endcode
 *
 * fields, tag and recursive are never inherited: they only apply to the
 * record that declares them. A Config is a value; compiled routines keep
 * their own copy.
 */
struct Config
{
    static constexpr std::string_view kDefaultTagKey = "__tag__";

    std::optional<KeyCase> keyCasingLoad;                   ///< default: none
    std::optional<KeyCase> keyCasingDump;                   ///< default: none
    std::map<std::string, FieldOptions> fields;             ///< per-field overrides, never inherited
    std::optional<std::string> tagKey;                      ///< default: "__tag__" once tags are in use
    std::optional<std::string> tag;                         ///< tag of this record in sum types, never inherited
    std::optional<bool> autoAssignTags;                     ///< default: false
    std::optional<bool> unsafeUnionDispatch;                ///< default: false
    std::optional<UnknownKeyAction> onUnknownKey;           ///< default: ignore
    std::optional<Condition> skipIf;                        ///< applied to every field on dump
    std::optional<bool> skipDefaults;                       ///< default: false
    std::optional<bool> recursive;                          ///< propagate to nested records, default: true, never inherited
    std::optional<DateTimeOutput> dateTimeOutput;           ///< default: iso
    std::optional<bool> namedTupleAsMap;                    ///< default: false
    std::optional<EnumMatch> enumMatch;                     ///< default: byValue
    std::optional<FractionalIntegers> fractionalIntegers;   ///< default: round
    std::optional<bool> collectErrors;                      ///< default: false

    /**
     * @brief Effective configuration of a record
     *
     * Options set in own win, otherwise the inherited value is used. The
     * never-inherited options are taken from own only.
     */
    static Config merge(Config const& own, Config const& inherited);

    /**
     * @brief Effective configuration of the record load(), dump() or compile() was called for
     *
     * Like merge(), but the Config passed at the call site addresses that
     * record directly: its fields, tag and recursive options apply to it,
     * per-field options merged over the record's own ones. Nested records
     * still never inherit them.
     */
    static Config atCallSite(Config const& own, Config const& caller);

    /// Canonical text form; equal fingerprints mean behaviourally equal configurations
    std::string fingerprint() const;

    /// The tag key to read and write, falling back to "__tag__"
    std::string effectiveTagKey() const;

    bool propagates() const noexcept { return recursive.value_or(true); }

    /// Explicit per-field options, or nullptr
    FieldOptions const* fieldOptions(std::string_view name) const;
};

} // namespace marshal
