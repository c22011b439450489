#pragma once

#include <array>
#include <functional>
#include <memory>
#include <string>
#include "config.hpp"
#include "descriptor.hpp"
#include "meta.hpp"
#include "value.hpp"

namespace marshal
{
class RoutineCache;
class SymbolTable;
class ExtensionRegistry;

/**
 * @brief Compiled conversion of one descriptor
 *
 * load converts a dynamic value into the storage it is given, dump does
 * the opposite. Both close over everything they need (element fragments,
 * lookup tables, nested routines), so a fragment is self-contained once
 * emitted.
 */
struct Fragment
{
    std::string binding;
    std::function<void(Value const&, void*)> load;
    std::function<Value(void const*)> dump;
};

/**
 * @brief State shared by the handlers while one routine is compiled
 *
 * Holds the effective configuration of the record being compiled, the
 * symbol table receiving the helper objects of its fragments and the
 * stack of records currently being compiled.
 */
class CompileContext
{
public:
    CompileContext(RoutineCache& cache, ExtensionRegistry const& registry, Config const& config,
                   SymbolTable& symbols, CompileStack& stack);

    /// Effective configuration of the record being compiled
    Config const& config() const noexcept            { return effective; }

    /// Configuration inherited by nested records: the effective one unless propagation is disabled
    Config nestedConfig() const;

    RoutineCache& cache() noexcept                   { return routineCache; }
    ExtensionRegistry const& registry() const noexcept { return extensions; }
    SymbolTable& symbols() noexcept                  { return symbolTable; }
    CompileStack& stack() noexcept                   { return compileStack; }

    /**
     * @brief Emits the fragment of a descriptor
     *
     * Optional wrappers go through the optional handler, registered types
     * through their extension entry and everything else through the
     * handler of the descriptor's kind.
     */
    Fragment emit(TypeDescriptor const& descriptor);

private:
    RoutineCache& routineCache;
    ExtensionRegistry const& extensions;
    Config const& effective;
    SymbolTable& symbolTable;
    CompileStack& compileStack;
};

/// Emits the fragment of one origin kind
using Handler = Fragment (*)(TypeDescriptor const&, CompileContext&);

/**
 * @brief The per-kind dispatch table
 *
 * Exactly one handler exists per Kind; the table is built once and never
 * modified. Types outside the table are served by the extension registry.
 */
class HandlerTable
{
public:
    static HandlerTable const& instance();

    Handler handlerFor(Kind kind) const noexcept { return handlers[static_cast<std::size_t>(kind)]; }

    Fragment emit(Kind kind, TypeDescriptor const& descriptor, CompileContext& context) const;

private:
    HandlerTable();

    std::array<Handler, kNumKinds> handlers {};
};

/// Canonical string form of a dumped mapping key
std::string canonicalKey(Value const& key);

} // namespace marshal
