#pragma once

#include <array>
#include <chrono>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include <concepts>
#include "boost/pfr.hpp"
#include "fixed_string.hpp"

namespace marshal
{

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name> class Field;
template <typename T, typename... Annotations> struct Annotated;
class Value;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name> struct is_field_helper<Field<T, Name>> : std::true_type {};

template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

/**
 * @brief References to the Field<> members of a record, in declaration order
 *
 * Plain members of the aggregate are not marshalled and are left out.
 */
template <typename Record>
auto fieldMembers(Record& record)
{
    return std::apply([] (auto&... members)
    {
        auto keepField = [] <typename M> (M& member)
        {
            if constexpr (is_field<M>::value)
                return std::tuple<M&>(member);
            else
                return std::tuple<>();
        };

        return std::tuple_cat(keepField(members)...);
    }, boost::pfr::structure_tie(record));
}

template <typename T> struct field_types;
template <typename... Fs> struct field_types<std::tuple<Fs...>> { using type = std::tuple<std::decay_t<Fs>...>; };

/// std::tuple of the Field<> types of record T
template <typename T>
using FieldTypes = typename field_types<decltype(fieldMembers(std::declval<T&>()))>::type;

/// Number of Field<> members of T, 0 for anything that is not an aggregate
template <typename T>
constexpr std::size_t num_fields()
{
    if constexpr (std::is_aggregate_v<T> && (! std::is_array_v<T>))
        return std::tuple_size_v<decltype(fieldMembers(std::declval<T&>()))>;

    return 0;
}

/// Visitor over the alternatives of a Value or KeyPath segment
template <typename... Lambdas>
struct multilambda : Lambdas... { using Lambdas::operator()...; };

template <typename... Lambdas>
multilambda(Lambdas...) -> multilambda<Lambdas...>;

/// Restores state such as the compile stack when a scope is left, also by an Error
template <typename Lambda>
[[nodiscard]] auto callAtEndOfScope(Lambda && lambda)
{
    struct Restore
    {
        Lambda fn;
        ~Restore() { fn(); }
    };

    return Restore { std::forward<Lambda>(lambda) };
}

//-----------------------------------------------------------------------------
// Annotation unwrapping
//-----------------------------------------------------------------------------

template <typename T> struct unannotated { using type = T; };
template <typename T, typename... As> struct unannotated<Annotated<T, As...>> { using type = T; };

/// The storage type of a field declared as T (Annotated<> wrappers are type-level only)
template <typename T> using unannotated_t = typename unannotated<T>::type;

template <typename T> struct is_annotated : std::false_type {};
template <typename T, typename... As> struct is_annotated<Annotated<T, As...>> : std::true_type {};

//-----------------------------------------------------------------------------
// Standard library shape detection
//-----------------------------------------------------------------------------

template <typename T, template <typename...> class Template>
struct is_specialization_of : std::false_type {};

template <template <typename...> class Template, typename... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template <typename T, template <typename...> class Template>
inline constexpr bool is_specialization_of_v = is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template <typename T> struct is_std_array : std::false_type {};
template <typename T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T> struct is_sys_time : std::false_type {};
template <typename D> struct is_sys_time<std::chrono::sys_time<D>> : std::true_type {};

template <typename T> struct is_time_of_day : std::false_type {};
template <typename D> struct is_time_of_day<std::chrono::hh_mm_ss<D>> : std::true_type {};

template <typename T> struct is_duration : std::false_type {};
template <typename R, typename P> struct is_duration<std::chrono::duration<R, P>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_like = is_specialization_of_v<T, std::optional>
                                      || is_specialization_of_v<T, std::unique_ptr>
                                      || is_specialization_of_v<T, std::shared_ptr>;

template <typename T>
inline constexpr bool is_sequence_like = is_specialization_of_v<T, std::vector>
                                      || is_specialization_of_v<T, std::deque>
                                      || is_specialization_of_v<T, std::list>;

template <typename T>
inline constexpr bool is_set_like = is_specialization_of_v<T, std::set>
                                 || is_specialization_of_v<T, std::unordered_set>;

template <typename T>
inline constexpr bool is_mapping_like = is_specialization_of_v<T, std::map>
                                     || is_specialization_of_v<T, std::unordered_map>;

template <typename T>
inline constexpr bool is_fixed_tuple_like = is_specialization_of_v<T, std::tuple>
                                         || is_specialization_of_v<T, std::pair>
                                         || is_std_array<std::remove_cvref_t<T>>::value;

/// True for enums that expose their members through an ADL visible enumMembers(E)
template <typename T>
concept EnumWithMembers = std::is_enum_v<T> && requires (T t) { enumMembers(t); };

/// True for records that supply their own marshalling configuration
template <typename T>
concept HasOwnConfig = requires { T::marshalConfig(); };

/// Aggregates with at least one Field<> member
template <typename T>
concept RecordLike = std::is_class_v<T> && std::is_aggregate_v<T> && (! std::is_array_v<T>) && (num_fields<T>() > 0);

/// Aggregates without Field<> members that Boost.PFR can reflect
template <typename T>
concept NamedTupleLike = std::is_class_v<T> && std::is_aggregate_v<T> && (! std::is_array_v<T>)
                      && (num_fields<T>() == 0) && (boost::pfr::tuple_size_v<T> > 0);

//-----------------------------------------------------------------------------
// Type names
//-----------------------------------------------------------------------------

/// Demangled name of a std::type_info
std::string demangle(std::type_info const& info);

/// Demangled name without namespaces and template arguments
std::string unqualifiedName(std::type_info const& info);

} // namespace detail

} // namespace marshal
