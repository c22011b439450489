#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "descriptor.hpp"
#include "handlers.hpp"
#include "meta.hpp"

namespace marshal
{

/**
 * @brief Tag identifying a record alternative of a sum type
 *
 * The record's own Config::tag if set, else its unqualified type name when
 * automatic tags are enabled (by the record itself or, failing that, by
 * the enclosing configuration), else nothing.
 */
std::optional<std::string> tagOf(MetaType const& alternative, Config const& enclosing);

/**
 * @brief Selects and runs the alternative of a sum type
 *
 * Load:
 *   - a map carrying the tag key is routed by its tag value
 *   - null selects the std::monostate alternative, if any
 *   - in unsafe mode a map goes to the first record alternative
 *   - otherwise alternatives whose kind matches the value exactly are
 *     tried first, then every alternative in declaration order
 *
 * Dump runs the active alternative and, if it is tagged and dumps to a
 * map, puts the tag under the tag key first.
 */
class UnionDispatcher
{
public:
    struct Alternative
    {
        std::size_t index;
        Kind kind;
        std::string name;
        std::optional<std::string> tag;
        Fragment fragment;
    };

    /// @throws Error ErrorKind::descriptorResolution if two alternatives share a tag
    UnionDispatcher(SumMeta const& meta, std::vector<Alternative> alternatives, std::string tagKey, bool unsafe);

    void load(Value const& value, void* target) const;
    Value dump(void const* source) const;

    bool tagged() const noexcept { return usesTags; }
    std::vector<std::string> knownTags() const;

private:
    void loadAlternative(Alternative const& alternative, Value const& value, void* target) const;
    bool matchesExactly(Alternative const& alternative, Value const& value) const;

    SumMeta const& meta;
    std::vector<Alternative> alternatives;
    std::string tagKey;
    bool unsafe;
    bool usesTags = false;
};

/// Dispatch table handler of Kind::sum
Fragment emitSum(TypeDescriptor const& descriptor, CompileContext& context);

} // namespace marshal
