#include "registry.hpp"
#include <mutex>

namespace marshal
{
ExtensionRegistry& ExtensionRegistry::global()
{
    static ExtensionRegistry registry;
    return registry;
}

void ExtensionRegistry::add(std::type_index type, ExtensionEntry entry)
{
    std::unique_lock guard(lock);
    entries.insert_or_assign(type, std::move(entry));
}

bool ExtensionRegistry::remove(std::type_index type)
{
    std::unique_lock guard(lock);
    return entries.erase(type) > 0;
}

std::optional<ExtensionEntry> ExtensionRegistry::find(std::type_index type) const
{
    std::shared_lock guard(lock);

    if (auto it = entries.find(type); it != entries.end())
        return it->second;

    return std::nullopt;
}

bool ExtensionRegistry::contains(std::type_index type) const
{
    std::shared_lock guard(lock);
    return entries.contains(type);
}
} // namespace marshal
