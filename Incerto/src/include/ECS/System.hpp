#pragma once

#include <ECS/Commands.hpp>
#include <ECS/Filter.hpp>
#include <ECS/Registry.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace Incerto::ECS {

// ---------------------------------------------------------------------------
// Access: the component and resource types a system touches.
//
// Two systems conflict when one writes a type the other reads or writes, or
// when either is exclusive (takes the whole Registry). The Scheduler never
// runs conflicting systems at the same time.
// ---------------------------------------------------------------------------
struct Access {
    std::vector<std::type_index> reads;
    std::vector<std::type_index> writes;
    bool exclusive = false;

    template<typename T> Access& Reads()  { AddRead(std::type_index(typeid(T)));  return *this; }
    template<typename T> Access& Writes() { AddWrite(std::type_index(typeid(T))); return *this; }

    void AddRead(std::type_index type) {
        if (Contains(writes, type) || Contains(reads, type)) return;
        reads.push_back(type);
    }

    // A write subsumes an earlier read of the same type.
    void AddWrite(std::type_index type) {
        reads.erase(std::remove(reads.begin(), reads.end(), type), reads.end());
        if (!Contains(writes, type)) writes.push_back(type);
    }

    [[nodiscard]] bool ConflictsWith(const Access& other) const {
        if (exclusive || other.exclusive) return true;
        for (const auto& w : writes)
            if (Contains(other.writes, w) || Contains(other.reads, w)) return true;
        for (const auto& r : reads)
            if (Contains(other.writes, r)) return true;
        return false;
    }

private:
    static bool Contains(const std::vector<std::type_index>& v, std::type_index t) {
        return std::find(v.begin(), v.end(), t) != v.end();
    }
};

// ---------------------------------------------------------------------------
// System: one update routine, run once per step by the Scheduler.
//
// Derive and override Update for hand-written systems. Unless GetAccess is
// overridden the system is exclusive and never shares a batch.
//
// Most systems are plain callables wrapped by MakeSystem, which reads their
// access from the parameter list:
//
//   MakeSystem("grow", [](Query<Counter, const Rate> q) {
//       q.Each([](EntityId, Counter& c, const Rate& r) { c.value += r.value; });
//   });
// ---------------------------------------------------------------------------
class System {
public:
    explicit System(std::string name = "system") : m_name(std::move(name)) {}
    virtual ~System() = default;

    // Advance this routine by one step.
    // Structural changes go through cmd; they are applied after the stage.
    virtual void Update(Registry& reg, Commands& cmd) = 0;

    [[nodiscard]] virtual Access GetAccess() const {
        Access access;
        access.exclusive = true;
        return access;
    }

    [[nodiscard]] const std::string& Name() const noexcept { return m_name; }

    // Disabled systems are skipped without being unregistered.
    void  SetEnabled(bool enabled) noexcept { m_enabled = enabled; }
    [[nodiscard]] bool IsEnabled() const noexcept { return m_enabled; }

private:
    std::string m_name;
    bool m_enabled = true;
};

// ---------------------------------------------------------------------------
// System parameters
// ---------------------------------------------------------------------------

// Query<Ts...>: a view handed to a system. Element types follow
// Registry::View: C is written, const C is read, With / Without only filter.
template<typename... Ts>
class Query {
public:
    static_assert(detail::HasData<Ts...>, "Query requires at least one component type");

    explicit Query(Registry& reg) noexcept : m_reg(&reg) {}

    // fn(EntityId, Data&...) for every matching entity.
    template<typename Fn>
    void Each(Fn&& fn) const {
        m_reg->template View<Ts...>(std::forward<Fn>(fn));
    }

    [[nodiscard]] size_t Count() const {
        size_t n = 0;
        Each([&n](EntityId, auto&&...) { ++n; });
        return n;
    }

    static void DeclareAccess(Access& access) {
        (Declare<Ts>(access), ...);
    }

private:
    template<typename T>
    static void Declare(Access& access) {
        if constexpr (detail::IsFilter<T>::value) {
            // presence only
        } else if constexpr (std::is_const_v<T>) {
            access.Reads<std::remove_const_t<T>>();
        } else {
            access.Writes<T>();
        }
    }

    Registry* m_reg;
};

// Read-only handle to a resource.
template<typename R>
class Res {
public:
    explicit Res(const R& value) noexcept : m_value(&value) {}
    [[nodiscard]] const R& operator*()  const noexcept { return *m_value; }
    [[nodiscard]] const R* operator->() const noexcept { return m_value; }
private:
    const R* m_value;
};

// Mutable handle to a resource.
template<typename R>
class ResMut {
public:
    explicit ResMut(R& value) noexcept : m_value(&value) {}
    [[nodiscard]] R& operator*()  const noexcept { return *m_value; }
    [[nodiscard]] R* operator->() const noexcept { return m_value; }
private:
    R* m_value;
};

namespace detail {

template<typename P>
using Bare = std::remove_cv_t<std::remove_reference_t<P>>;

template<typename R>
R& RequireResource(Registry& reg) {
    R* r = reg.TryGetResource<R>();
    if (!r)
        throw std::runtime_error(std::string("system requires missing resource ") + typeid(R).name());
    return *r;
}

// SystemParam<P>: how a system parameter of (bare) type P is fetched and
// what access it declares. Unsupported parameter types fail to compile.
template<typename P> struct SystemParam;

template<typename... Ts>
struct SystemParam<Query<Ts...>> {
    static Query<Ts...> Fetch(Registry& reg, Commands&) { return Query<Ts...>(reg); }
    static void Declare(Access& access) { Query<Ts...>::DeclareAccess(access); }
};

template<typename R>
struct SystemParam<Res<R>> {
    static Res<R> Fetch(Registry& reg, Commands&) { return Res<R>(RequireResource<R>(reg)); }
    static void Declare(Access& access) { access.Reads<R>(); }
};

template<typename R>
struct SystemParam<ResMut<R>> {
    static ResMut<R> Fetch(Registry& reg, Commands&) { return ResMut<R>(RequireResource<R>(reg)); }
    static void Declare(Access& access) { access.Writes<R>(); }
};

template<>
struct SystemParam<Commands> {
    static Commands& Fetch(Registry&, Commands& cmd) { return cmd; }
    static void Declare(Access&) {}
};

// Taking the Registry itself makes the system exclusive.
template<>
struct SystemParam<Registry> {
    static Registry& Fetch(Registry& reg, Commands&) { return reg; }
    static void Declare(Access& access) { access.exclusive = true; }
};

template<typename F>
struct FunctionTraits : FunctionTraits<decltype(&F::operator())> {};

template<typename R, typename... A>
struct FunctionTraits<R (*)(A...)> { using Args = TypeList<A...>; };

template<typename R, typename... A>
struct FunctionTraits<R(A...)> { using Args = TypeList<A...>; };

template<typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...)> { using Args = TypeList<A...>; };

template<typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...) const> { using Args = TypeList<A...>; };

} // namespace detail

// FunctionSystem: adapts a callable whose parameters are system parameters.
template<typename Fn, typename Args = typename detail::FunctionTraits<Fn>::Args>
class FunctionSystem;

template<typename Fn, typename... Ps>
class FunctionSystem<Fn, detail::TypeList<Ps...>> final : public System {
public:
    FunctionSystem(std::string name, Fn fn)
        : System(std::move(name)), m_fn(std::move(fn)) {}

    void Update(Registry& reg, Commands& cmd) override {
        m_fn(detail::SystemParam<detail::Bare<Ps>>::Fetch(reg, cmd)...);
    }

    [[nodiscard]] Access GetAccess() const override {
        Access access;
        (detail::SystemParam<detail::Bare<Ps>>::Declare(access), ...);
        return access;
    }

private:
    Fn m_fn;
};

template<typename Fn>
[[nodiscard]] std::unique_ptr<System> MakeSystem(std::string name, Fn&& fn) {
    using F = std::decay_t<Fn>;
    return std::make_unique<FunctionSystem<F>>(std::move(name), std::forward<Fn>(fn));
}

} // namespace Incerto::ECS
