#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>
#include "config.hpp"
#include "descriptor.hpp"
#include "errors.hpp"
#include "meta.hpp"
#include "value.hpp"

namespace marshal
{
class RoutineCache;
class ExtensionRegistry;

//=============================================================================
// Symbol table
//=============================================================================
/**
 * @brief Named helper objects referenced by a routine's fragments
 *
 * Every enum lookup table, pattern list, nested routine and extension
 * entry a routine uses is bound here under a unique name derived from the
 * binding of the descriptor that needs it, e.g. "enum_f2_v0".
 */
class SymbolTable
{
public:
    /// Binds value under name and returns it; a name can only be bound once
    template <typename T>
    std::shared_ptr<T> bind(std::string name, std::shared_ptr<T> value)
    {
        insert(std::move(name), std::type_index(typeid(T)), value);
        return value;
    }

    /// The object bound under name, or nullptr if absent or of another type
    template <typename T>
    std::shared_ptr<T const> find(std::string_view name) const
    {
        auto it = symbols.find(name);

        if (it == symbols.end() || it->second.type != std::type_index(typeid(T)))
            return nullptr;

        return std::static_pointer_cast<T const>(it->second.value);
    }

    bool contains(std::string_view name) const { return symbols.find(name) != symbols.end(); }
    std::size_t size() const noexcept          { return symbols.size(); }
    std::vector<std::string> names() const;

private:
    struct Symbol
    {
        std::type_index type;
        std::shared_ptr<void const> value;
    };

    void insert(std::string name, std::type_index type, std::shared_ptr<void const> value);

    std::map<std::string, Symbol, std::less<>> symbols;
};

//=============================================================================
// Routines
//=============================================================================
/**
 * @brief The compiled load and dump conversion of one type under one configuration
 *
 * Routines are immutable and shared: the cache hands the same instance to
 * every thread asking for the same (type, configuration) pair.
 */
class Routine
{
public:
    using LoadFn = std::function<void(Value const&, void*)>;
    using DumpFn = std::function<Value(void const*)>;

    Routine(MetaType const& type, Config config, SymbolTable symbols,
            LoadFn load, DumpFn dump, std::vector<std::string> listing);

    /// Converts value into the object at target, which must be of type()
    void load(Value const& value, void* target) const { loadFn(value, target); }

    /// Converts the object at source, which must be of type(), into a dynamic value
    Value dump(void const* source) const              { return dumpFn(source); }

    MetaType const& type() const noexcept             { return metaType; }
    Config const& config() const noexcept             { return effective; }
    SymbolTable const& symbols() const noexcept       { return symbolTable; }

    /// One line per field: binding, name, type and keys; for diagnostics
    std::vector<std::string> const& listing() const noexcept { return lines; }

private:
    MetaType const& metaType;
    Config effective;
    SymbolTable symbolTable;
    LoadFn loadFn;
    DumpFn dumpFn;
    std::vector<std::string> lines;
};

//=============================================================================
// Assembler
//=============================================================================
/**
 * @brief Builds the routine of one type under its effective configuration
 *
 * For records every field is resolved, its fragment emitted and its keys
 * computed; the resulting plans are closed over by one load and one dump
 * function. Any other type becomes a routine around a single fragment.
 * Nested records are requested from the cache, records already on the
 * compile stack are bound late.
 */
class RoutineAssembler
{
public:
    RoutineAssembler(MetaType const& type, Config effective, RoutineCache& cache,
                     ExtensionRegistry const& registry, CompileStack& stack);

    /// @throws Error on descriptor resolution or unsupported types
    std::shared_ptr<Routine const> assemble();

private:
    std::shared_ptr<Routine const> assembleRecord();
    std::shared_ptr<Routine const> assembleValue();

    MetaType const& type;
    Config effective;
    RoutineCache& cache;
    ExtensionRegistry const& registry;
    CompileStack& stack;
};

/**
 * @brief Checks a type graph without compiling it
 *
 * Walks every record reachable from type, resolving each field under the
 * configuration it would be compiled with, and returns every problem found
 * rather than stopping at the first.
 */
std::vector<Error> validateSchema(MetaType const& type, Config const& inherited, ExtensionRegistry const& registry);

} // namespace marshal
