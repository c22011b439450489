#include "cache.hpp"
#include <functional>
#include "logging.hpp"

namespace marshal
{
std::size_t RoutineCache::KeyHash::operator()(Key const& key) const noexcept
{
    return std::hash<std::type_index>()(key.first) ^ (std::hash<std::string>()(key.second) << 1);
}

RoutineCache::RoutineCache(ExtensionRegistry const& registry)
    : extensions(registry)
{}

RoutineCache& RoutineCache::global()
{
    static RoutineCache cache;
    return cache;
}

Config RoutineCache::effectiveConfig(MetaType const& type, Config const& inherited, bool callSite)
{
    if (type.kind() != Kind::record)
        return inherited;

    Key key { type.typeIndex(), (callSite ? "call|" : "") + inherited.fingerprint() };

    {
        std::lock_guard guard(lock);

        if (auto it = configs.find(key); it != configs.end())
            return it->second;
    }

    auto const own = static_cast<RecordMeta const&>(type).ownConfig();
    auto merged = callSite ? Config::atCallSite(own, inherited) : Config::merge(own, inherited);

    std::lock_guard guard(lock);
    return configs.try_emplace(std::move(key), std::move(merged)).first->second;
}

std::shared_ptr<Routine const> RoutineCache::find(MetaType const& type, Config const& inherited)
{
    Key key { type.typeIndex(), effectiveConfig(type, inherited).fingerprint() };

    std::lock_guard guard(lock);
    auto it = routines.find(key);
    return it != routines.end() ? it->second : nullptr;
}

std::shared_ptr<Routine const> RoutineCache::getOrCompile(MetaType const& type, Config const& inherited)
{
    CompileStack stack;
    return getOrCompile(type, inherited, stack);
}

std::shared_ptr<Routine const> RoutineCache::getOrCompileForCall(MetaType const& type, Config const& callConfig)
{
    CompileStack stack;
    return compileEffective(type, effectiveConfig(type, callConfig, true), stack);
}

std::shared_ptr<Routine const> RoutineCache::getOrCompile(MetaType const& type, Config const& inherited, CompileStack& stack)
{
    return compileEffective(type, effectiveConfig(type, inherited), stack);
}

std::shared_ptr<Routine const> RoutineCache::compileEffective(MetaType const& type, Config effective, CompileStack& stack)
{
    Key key { type.typeIndex(), effective.fingerprint() };

    {
        std::lock_guard guard(lock);

        if (auto it = routines.find(key); it != routines.end())
            return it->second;
    }

    auto routine = RoutineAssembler(type, std::move(effective), *this, extensions, stack).assemble();
    ++compileCount;

    log(LogLevel::debug, "compiled routine for {} ({} symbols)", type.name(), routine->symbols().size());

    std::lock_guard guard(lock);
    return routines.try_emplace(std::move(key), std::move(routine)).first->second;
}

std::size_t RoutineCache::size() const
{
    std::lock_guard guard(lock);
    return routines.size();
}

//=============================================================================
LateBoundRoutine::LateBoundRoutine(RoutineCache& routineCache, MetaType const& metaType, Config config)
    : cache(routineCache), type(metaType), inherited(std::move(config))
{}

Routine const& LateBoundRoutine::get() const
{
    if (auto const* routine = resolved.load(std::memory_order_acquire))
        return *routine;

    auto routine = cache.getOrCompile(type, inherited);
    resolved.store(routine.get(), std::memory_order_release);
    return *routine;
}
} // namespace marshal
