#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include "assembler.hpp"
#include "config.hpp"
#include "descriptor.hpp"
#include "meta.hpp"
#include "registry.hpp"

namespace marshal
{

/**
 * @brief Process-wide store of compiled routines
 *
 * Routines are keyed by the type and the fingerprint of its effective
 * configuration, so a type compiles at most once per behaviourally distinct
 * configuration. Effective configurations are merged once per (type,
 * inherited configuration) pair and cached as well.
 *
 * Compilation runs outside the lock. When two threads compile the same key
 * concurrently the first published routine wins and both callers get it.
 */
class RoutineCache
{
public:
    explicit RoutineCache(ExtensionRegistry const& registry = ExtensionRegistry::global());

    static RoutineCache& global();

    /// The routine of type under inherited, compiling it on first use
    std::shared_ptr<Routine const> getOrCompile(MetaType const& type, Config const& inherited);

    /**
     * @brief The routine load(), dump() and compile() use for type
     *
     * callConfig applies to type as its call site configuration (see
     * Config::atCallSite()), including the options nested records never
     * inherit.
     */
    std::shared_ptr<Routine const> getOrCompileForCall(MetaType const& type, Config const& callConfig);

    /// Same as above while other records are being compiled; stack lists them
    std::shared_ptr<Routine const> getOrCompile(MetaType const& type, Config const& inherited, CompileStack& stack);

    /// The already compiled routine, or nullptr
    std::shared_ptr<Routine const> find(MetaType const& type, Config const& inherited);

    /// Merges the type's own configuration over inherited, or over the call site configuration
    Config effectiveConfig(MetaType const& type, Config const& inherited, bool callSite = false);

    ExtensionRegistry const& registry() const noexcept { return extensions; }

    std::size_t size() const;

    /// Number of routines compiled so far, including discarded concurrent duplicates
    std::size_t compilations() const noexcept { return compileCount.load(); }

private:
    using Key = std::pair<std::type_index, std::string>;

    std::shared_ptr<Routine const> compileEffective(MetaType const& type, Config effective, CompileStack& stack);

    struct KeyHash
    {
        std::size_t operator()(Key const& key) const noexcept;
    };

    ExtensionRegistry const& extensions;
    mutable std::mutex lock;
    std::unordered_map<Key, std::shared_ptr<Routine const>, KeyHash> routines;
    std::unordered_map<Key, Config, KeyHash> configs;
    std::atomic<std::size_t> compileCount { 0 };
};

/**
 * @brief Reference to a routine that is still being compiled
 *
 * Emitted for a field whose record is on the compile stack. The routine
 * is looked up from the cache on first use, by which time the compilation
 * that created this reference has been published.
 */
class LateBoundRoutine
{
public:
    LateBoundRoutine(RoutineCache& cache, MetaType const& type, Config inherited);

    Routine const& get() const;

private:
    RoutineCache& cache;
    MetaType const& type;
    Config inherited;
    mutable std::atomic<Routine const*> resolved { nullptr };
};

} // namespace marshal
