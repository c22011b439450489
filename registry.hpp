#pragma once

#include <functional>
#include <optional>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <variant>
#include "value.hpp"

namespace marshal
{
struct Fragment;
struct TypeDescriptor;
class CompileContext;

/// Converts a dynamic value into the object at target
using LoadHook = std::function<void(Value const&, void*)>;

/// Converts the object at source into a dynamic value
using DumpHook = std::function<Value(void const*)>;

/// Emits a fragment for a descriptor, with full access to the compile context
using FragmentHook = std::function<Fragment(TypeDescriptor const&, CompileContext&)>;

/**
 * @brief User supplied conversions of one type
 *
 * Each direction is either a plain runtime transform or a code generating
 * hook that builds the fragment itself. A direction left empty falls back
 * to the default of registerType(): construction from the string form on
 * load and operator<< on dump.
 */
struct ExtensionEntry
{
    std::variant<std::monostate, LoadHook, FragmentHook> load;
    std::variant<std::monostate, DumpHook, FragmentHook> dump;
};

/**
 * @brief Maps types to extension entries
 *
 * The registry is consulted before the built-in dispatch table, so an
 * entry overrides the built-in handling of any type. Routines compiled
 * before an entry is added keep their previous behaviour.
 *
 * Thread-safe; use global() unless an isolated registry is required.
 */
class ExtensionRegistry
{
public:
    static ExtensionRegistry& global();

    /// Adds or replaces the entry of type
    void add(std::type_index type, ExtensionEntry entry);

    bool remove(std::type_index type);

    std::optional<ExtensionEntry> find(std::type_index type) const;
    bool contains(std::type_index type) const;

private:
    mutable std::shared_mutex lock;
    std::unordered_map<std::type_index, ExtensionEntry> entries;
};

} // namespace marshal
