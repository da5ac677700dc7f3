#pragma once

#include <type_traits>

namespace Incerto::ECS {

// ---------------------------------------------------------------------------
// Presence filters for Registry::View / Query.
//
//   reg.View<Counter, With<GroupA>, Without<Frozen>>(...)
//
// A filter restricts which entities are visited but hands no record to the
// callback and declares no data access, so it never makes two systems
// conflict.
// ---------------------------------------------------------------------------

template<typename... Ms> struct With    {};
template<typename... Ms> struct Without {};

namespace detail {

template<typename... Ts> struct TypeList {};

template<typename T> struct IsFilter : std::false_type {};
template<typename... Ms> struct IsFilter<With<Ms...>>    : std::true_type {};
template<typename... Ms> struct IsFilter<Without<Ms...>> : std::true_type {};

template<typename... Ls> struct Concat;
template<> struct Concat<> { using type = TypeList<>; };
template<typename... As> struct Concat<TypeList<As...>> { using type = TypeList<As...>; };
template<typename... As, typename... Bs, typename... Rest>
struct Concat<TypeList<As...>, TypeList<Bs...>, Rest...> {
    using type = typename Concat<TypeList<As..., Bs...>, Rest...>::type;
};

// The data (non-filter) elements of a view, in declaration order.
template<typename... Ts>
using DataList = typename Concat<
    std::conditional_t<IsFilter<Ts>::value, TypeList<>, TypeList<Ts>>...>::type;

template<typename... Ts>
inline constexpr bool HasData = (!IsFilter<Ts>::value || ...);

// Default: a data element imposes no extra condition.
template<typename T>
struct FilterMatch {
    template<typename Reg, typename Id>
    static bool Match(const Reg&, Id) { return true; }
};

template<typename... Ms>
struct FilterMatch<With<Ms...>> {
    template<typename Reg, typename Id>
    static bool Match(const Reg& reg, Id id) {
        return (reg.template HasComponent<Ms>(id) && ...);
    }
};

template<typename... Ms>
struct FilterMatch<Without<Ms...>> {
    template<typename Reg, typename Id>
    static bool Match(const Reg& reg, Id id) {
        return (!reg.template HasComponent<Ms>(id) && ...);
    }
};

} // namespace detail

} // namespace Incerto::ECS
