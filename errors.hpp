#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "value.hpp"

namespace marshal
{

/// Categories of conversion and compilation failures
enum class ErrorKind
{
    descriptorResolution,   ///< a declared type cannot be resolved into a descriptor
    missingField,           ///< required field absent after trying every candidate key
    unknownKey,             ///< input key not mapped to the schema (on_unknown_key = raise)
    typeMismatch,           ///< value does not coerce to the expected scalar or shape
    lengthMismatch,         ///< fixed tuple loaded from a sequence of the wrong length
    tagDispatch,            ///< no sum-type alternative matches, or unknown tag value
    patternParse,           ///< date/time value matches none of the patterns tried
    unsupportedType,        ///< no handler and no extension registry entry
    aggregate               ///< several errors collected in collect-all mode
};

std::string_view toString(ErrorKind kind) noexcept;

/**
 * @brief Exception thrown by every load, dump and compilation failure
 *
 * While an error travels outwards through nested routines it gets
 * attributed with the field path (outer field first) and the outermost
 * record it happened in, so the final message reads like
 * "Line.start.x: expected float, got string "a"".
 *
 * In collect-all mode (Config::collectErrors, validateSchema()) failures
 * of sibling fields are gathered into one error of kind
 * ErrorKind::aggregate whose errors() lists them.
 */
class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, std::string message, std::optional<Value> offendingValue = std::nullopt);

    /// Creates an aggregate error, flattening nested aggregates
    static Error aggregate(std::vector<Error> errors);

    ErrorKind kind() const noexcept                      { return errorKind; }

    /// The message without location information
    std::string const& message() const noexcept          { return msg; }

    /// The outermost record the error was attributed to (may be empty)
    std::string const& record() const noexcept           { return recordName; }

    /// Field names, "[index]" and "[\"key\"]" segments, outermost first
    std::vector<std::string> const& path() const noexcept { return segments; }

    /// The path rendered as "field.nested[2].leaf"
    std::string pathString() const;

    /// The raw dynamic value that failed to convert, if known
    std::optional<Value> const& value() const noexcept   { return rawValue; }

    /// Child errors of an aggregate error
    std::vector<Error> const& errors() const noexcept    { return children; }

    Error& prependField(std::string_view name);
    Error& prependIndex(std::size_t index);
    Error& prependKey(std::string_view key);

    /// Attributes the error to a record; called from inside out so the outermost record wins
    Error& inRecord(std::string_view name);

    char const* what() const noexcept override           { return text.c_str(); }

private:
    void rebuild();

    ErrorKind errorKind;
    std::string msg;
    std::string recordName;
    std::vector<std::string> segments;
    std::optional<Value> rawValue;
    std::vector<Error> children;
    std::string text;
};

/// Shortcut for the common "expected X, got Y" type mismatch
[[nodiscard]] Error typeMismatch(std::string_view expected, Value const& got);

} // namespace marshal
