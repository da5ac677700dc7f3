#pragma once

#include <ECS/Entity.hpp>
#include <ECS/ComponentPool.hpp>
#include <ECS/Filter.hpp>

#include <algorithm>
#include <cassert>
#include <memory>
#include <queue>
#include <stdexcept>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Incerto::ECS {

// ---------------------------------------------------------------------------
// Registry: entity storage for one simulated population.
//
// Responsibilities
// ----------------
//  • Entity lifecycle  : CreateEntity / Spawn / DestroyEntity / IsAlive / Clear
//  • Component API     : AddComponent / GetComponent / HasComponent /
//                        RemoveComponent
//  • Querying          : View<Ts...>   visit entities owning every data type
//                        Count<T, Fs...>
//  • Resources         : one singleton value per type, survives Clear()
//
// View element types
// ------------------
//   C              record handed to the callback as C&
//   const C        record handed to the callback as const C&
//   With<Ms...>    entity must also own every M (no record handed over)
//   Without<Ms...> entity must own none of the Ms
//
//   reg.View<Counter, const Rate, Without<Frozen>>(
//       [](EntityId, Counter& c, const Rate& r) { c.value += r.value; });
//
// Thread safety
// -------------
//   Views and reads on distinct pools may run concurrently. Anything that
//   creates a pool or changes entity structure (CreateEntity, Spawn,
//   AddComponent, RemoveComponent, DestroyEntity, Clear, InsertResource)
//   must be single-threaded; systems go through Commands for those.
// ---------------------------------------------------------------------------

class Registry {
public:
    Registry()  = default;
    ~Registry() = default;

    Registry(const Registry&)            = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&)                 = default;
    Registry& operator=(Registry&&)      = default;

    // -----------------------------------------------------------------------
    // Entity lifecycle
    // -----------------------------------------------------------------------

    // Create an empty entity. Reuses freed slots when available.
    // Throws std::length_error once MAX_ENTITIES slots are live.
    [[nodiscard]] EntityId CreateEntity() {
        uint32_t idx;
        if (!m_freeList.empty()) {
            idx = m_freeList.front();
            m_freeList.pop();
        } else {
            if (m_generations.size() >= MAX_ENTITIES)
                throw std::length_error("Registry: entity capacity exhausted");
            idx = static_cast<uint32_t>(m_generations.size());
            m_generations.push_back(0u);
        }
        const EntityId id = MakeEntity(idx, m_generations[idx]);
        m_alive.push_back(id);
        return id;
    }

    // Create an entity owning exactly the given bundle of records.
    // Each record type may appear once per bundle.
    template<typename... Cs>
    EntityId Spawn(Cs&&... components) {
        const EntityId id = CreateEntity();
        (AddComponent<std::decay_t<Cs>>(id, std::forward<Cs>(components)), ...);
        return id;
    }

    // Remove every record of the entity and invalidate its id.
    void DestroyEntity(EntityId id) {
        if (!IsAlive(id)) return;
        const uint32_t idx = EntityIndex(id);
        for (auto& [type, pool] : m_pools)
            pool->Remove(idx);
        ++m_generations[idx];
        m_freeList.push(idx);
        auto it = std::find(m_alive.begin(), m_alive.end(), id);
        if (it != m_alive.end()) m_alive.erase(it);
    }

    [[nodiscard]] bool IsAlive(EntityId id) const noexcept {
        const uint32_t idx = EntityIndex(id);
        return idx < m_generations.size()
            && EntityGeneration(id) == m_generations[idx];
    }

    // Live entities in creation order (destruction reorders nothing).
    [[nodiscard]] const std::vector<EntityId>& Entities() const noexcept {
        return m_alive;
    }

    [[nodiscard]] size_t EntityCount() const noexcept { return m_alive.size(); }

    // Destroy every entity and every record. Pools and resources stay.
    void Clear() {
        m_alive.clear();
        m_generations.clear();
        while (!m_freeList.empty()) m_freeList.pop();
        for (auto& [type, pool] : m_pools) pool->Clear();
    }

    // -----------------------------------------------------------------------
    // Component API
    // -----------------------------------------------------------------------

    template<typename T, typename... Args>
    T& AddComponent(EntityId id, Args&&... args) {
        assert(IsAlive(id) && "Registry::AddComponent: entity is not alive");
        return Pool<T>().Emplace(EntityIndex(id), std::forward<Args>(args)...);
    }

    template<typename T>
    [[nodiscard]] bool HasComponent(EntityId id) const {
        const auto* p = PoolPtr<T>();
        return p && p->Has(EntityIndex(id));
    }

    template<typename T>
    [[nodiscard]] T& GetComponent(EntityId id) {
        assert(IsAlive(id)         && "Registry::GetComponent: entity is not alive");
        assert(HasComponent<T>(id) && "Registry::GetComponent: entity does not own component");
        return PoolPtr<T>()->Get(EntityIndex(id));
    }
    template<typename T>
    [[nodiscard]] const T& GetComponent(EntityId id) const {
        assert(IsAlive(id)         && "Registry::GetComponent: entity is not alive");
        assert(HasComponent<T>(id) && "Registry::GetComponent: entity does not own component");
        return PoolPtr<T>()->Get(EntityIndex(id));
    }

    template<typename T>
    void RemoveComponent(EntityId id) {
        if (auto* p = PoolPtr<T>()) p->Remove(EntityIndex(id));
    }

    // -----------------------------------------------------------------------
    // Querying
    // -----------------------------------------------------------------------

    // View<Ts...>(fn): calls fn(EntityId, Data&...) for every entity that
    // owns all data elements of Ts and passes every filter in Ts.
    //
    // Iteration is driven by the smallest pool among the data types, over a
    // snapshot of its slot list, so creating entities inside fn is safe;
    // removing an iterated type inside fn is not.
    template<typename... Ts, typename Fn>
    void View(Fn&& fn) {
        static_assert(detail::HasData<Ts...>, "View requires at least one component type");
        RunView<Ts...>(fn, detail::DataList<Ts...>{});
    }

    // Read-only view: every record is handed over as const&.
    template<typename... Ts, typename Fn>
    void View(Fn&& fn) const {
        static_assert(detail::HasData<Ts...>, "View requires at least one component type");
        RunConstView<Ts...>(fn, detail::DataList<Ts...>{});
    }

    // Number of entities owning T and passing every filter in Fs.
    template<typename T, typename... Fs>
    [[nodiscard]] size_t Count() const {
        const auto* p = PoolPtr<T>();
        if (!p) return 0;
        if constexpr (sizeof...(Fs) == 0) {
            return p->Size();
        } else {
            size_t n = 0;
            View<const T, Fs...>([&n](EntityId, const T&) { ++n; });
            return n;
        }
    }

    // -----------------------------------------------------------------------
    // Resources
    // -----------------------------------------------------------------------

    // Insert or replace the singleton of type R.
    template<typename R>
    R& InsertResource(R value) {
        auto slot = std::make_unique<ResourceSlot<R>>(std::move(value));
        R& ref = slot->value;
        m_resources[std::type_index(typeid(R))] = std::move(slot);
        return ref;
    }

    template<typename R>
    [[nodiscard]] bool HasResource() const {
        return m_resources.count(std::type_index(typeid(R))) != 0;
    }

    template<typename R>
    [[nodiscard]] R* TryGetResource() {
        const auto it = m_resources.find(std::type_index(typeid(R)));
        return it != m_resources.end()
            ? &static_cast<ResourceSlot<R>*>(it->second.get())->value
            : nullptr;
    }
    template<typename R>
    [[nodiscard]] const R* TryGetResource() const {
        const auto it = m_resources.find(std::type_index(typeid(R)));
        return it != m_resources.end()
            ? &static_cast<const ResourceSlot<R>*>(it->second.get())->value
            : nullptr;
    }

    template<typename R>
    [[nodiscard]] R& GetResource() {
        R* r = TryGetResource<R>();
        assert(r && "Registry::GetResource: resource was never inserted");
        return *r;
    }
    template<typename R>
    [[nodiscard]] const R& GetResource() const {
        const R* r = TryGetResource<R>();
        assert(r && "Registry::GetResource: resource was never inserted");
        return *r;
    }

    template<typename R>
    void RemoveResource() {
        m_resources.erase(std::type_index(typeid(R)));
    }

    // -----------------------------------------------------------------------
    // Direct pool access
    // -----------------------------------------------------------------------

    // Returns the pool for T, creating it on first use.
    template<typename T>
    [[nodiscard]] ComponentPool<T>& Pool() {
        const auto key = std::type_index(typeid(T));
        auto it = m_pools.find(key);
        if (it == m_pools.end()) {
            auto pool = std::make_unique<ComponentPool<T>>();
            auto* raw = pool.get();
            m_pools.emplace(key, std::move(pool));
            return *raw;
        }
        return *static_cast<ComponentPool<T>*>(it->second.get());
    }

    template<typename T>
    [[nodiscard]] ComponentPool<T>* PoolPtr() {
        const auto it = m_pools.find(std::type_index(typeid(T)));
        return it != m_pools.end()
            ? static_cast<ComponentPool<T>*>(it->second.get())
            : nullptr;
    }

    template<typename T>
    [[nodiscard]] const ComponentPool<T>* PoolPtr() const {
        const auto it = m_pools.find(std::type_index(typeid(T)));
        return it != m_pools.end()
            ? static_cast<const ComponentPool<T>*>(it->second.get())
            : nullptr;
    }

private:
    struct IResource {
        virtual ~IResource() = default;
    };

    template<typename R>
    struct ResourceSlot final : IResource {
        explicit ResourceSlot(R v) : value(std::move(v)) {}
        R value;
    };

    template<typename... Ts, typename Fn, typename... Ds>
    void RunView(Fn& fn, detail::TypeList<Ds...>) {
        const IPool* smallest = SmallestPool<std::remove_const_t<Ds>...>();
        if (!smallest || smallest->Size() == 0) return;

        const auto idxList = smallest->EntityIndices();
        for (const uint32_t idx : idxList) {
            if (idx >= m_generations.size()) continue;
            const EntityId id = MakeEntity(idx, m_generations[idx]);
            if (!(HasComponent<std::remove_const_t<Ds>>(id) && ...)) continue;
            if (!(detail::FilterMatch<Ts>::Match(*this, id) && ...)) continue;
            fn(id, static_cast<Ds&>(PoolPtr<std::remove_const_t<Ds>>()->Get(idx))...);
        }
    }

    template<typename... Ts, typename Fn, typename... Ds>
    void RunConstView(Fn& fn, detail::TypeList<Ds...>) const {
        const IPool* smallest = SmallestPool<std::remove_const_t<Ds>...>();
        if (!smallest || smallest->Size() == 0) return;

        const auto idxList = smallest->EntityIndices();
        for (const uint32_t idx : idxList) {
            if (idx >= m_generations.size()) continue;
            const EntityId id = MakeEntity(idx, m_generations[idx]);
            if (!(HasComponent<std::remove_const_t<Ds>>(id) && ...)) continue;
            if (!(detail::FilterMatch<Ts>::Match(*this, id) && ...)) continue;
            fn(id, PoolPtr<std::remove_const_t<Ds>>()->Get(idx)...);
        }
    }

    // Pool with the fewest records among Ts, or nullptr if any is missing
    // (a missing pool means nothing can match).
    template<typename... Ts>
    [[nodiscard]] const IPool* SmallestPool() const {
        const IPool* pools[] = { PoolPtr<Ts>()... };
        const IPool* result  = nullptr;
        size_t minSize = ~size_t(0);
        for (const auto* p : pools) {
            if (!p) return nullptr;
            if (p->Size() < minSize) { minSize = p->Size(); result = p; }
        }
        return result;
    }

    std::vector<EntityId>  m_alive;
    std::vector<uint32_t>  m_generations;
    std::queue<uint32_t>   m_freeList;

    std::unordered_map<std::type_index, std::unique_ptr<IPool>>     m_pools;
    std::unordered_map<std::type_index, std::unique_ptr<IResource>> m_resources;
};

} // namespace Incerto::ECS
