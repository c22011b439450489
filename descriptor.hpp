#pragma once

#include <cstddef>
#include <string>
#include <typeindex>
#include <vector>
#include "config.hpp"
#include "meta.hpp"

namespace marshal
{

/// Records whose routines are currently being compiled, outermost first
using CompileStack = std::vector<std::type_index>;

/**
 * @brief Canonical, immutable description of a declared type
 *
 * Optional wrappers are unwrapped into optionals (outermost first) and
 * Annotated<> metadata has been moved into annotations. Containers, sums
 * and tuples hold their resolved argument descriptors; records never do:
 * a nested record is compiled into its own routine.
 */
struct TypeDescriptor
{
    Kind kind = Kind::custom;
    MetaType const* type = nullptr;
    std::vector<OptionalMeta const*> optionals;
    std::vector<TypeDescriptor> arguments;
    FieldOptions annotations;
    std::string fieldName;
    std::size_t fieldOrdinal = 0;
    std::size_t iteration = 0;
    bool recursive = false;
    bool mapKey = false;                ///< key of a mapping; loads from the canonical key text

    bool inOptional() const noexcept { return ! optionals.empty(); }

    /// Unique local binding of this descriptor's fragment: "f<ordinal>_v<iteration>"
    std::string binding() const;

    /// Type rendering for diagnostics, e.g. "optional<vector<integer>>"
    std::string describe() const;
};

/// State of the resolution of one field
struct ResolveContext
{
    std::string fieldName;
    std::size_t fieldOrdinal = 0;
    FieldOptions options;
    CompileStack const* stack = nullptr;
    std::size_t nextIteration = 0;
    std::vector<std::type_index> namedTupleChain;
};

/**
 * @brief Resolves a declared type into a descriptor
 *
 * Unwraps optional-like wrappers, resolves type arguments depth first
 * (each one taking the next iteration index of context) and marks records
 * that are on the compile stack as recursive instead of descending.
 *
 * @throws Error ErrorKind::descriptorResolution naming the offending fragment;
 *         the caller attributes it to the field
 */
TypeDescriptor resolve(MetaType const& declared, ResolveContext& context);

/**
 * @brief Resolves one field of a record
 *
 * Merges the field's Annotated<> options with the explicit overrides in
 * config (which take precedence), checks the options against the
 * resolved type and resolves the field type.
 *
 * @throws Error ErrorKind::descriptorResolution
 */
TypeDescriptor resolveField(FieldDescriptor const& field, std::size_t fieldOrdinal,
                            Config const& config, CompileStack const& stack);

/**
 * @brief Checks record level invariants (unique field names)
 *
 * @throws Error ErrorKind::descriptorResolution
 */
void checkRecord(MetaType const& record);

} // namespace marshal
