#pragma once

#include <ECS/Entity.hpp>

#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace Incerto::ECS {

class Registry;

// ---------------------------------------------------------------------------
// Commands: structural changes recorded by a system and applied later.
//
// Systems of one batch run concurrently and only hold pool-level access, so
// they must not create entities or add / remove records directly. They queue
// the change here instead; the Scheduler applies every buffer of a stage, in
// system registration order, once the stage has finished.
//
// Recorded records are copied into the queue, so they must be copyable.
// ---------------------------------------------------------------------------
class Commands {
public:
    // Queue creation of an entity owning exactly the given bundle.
    template<typename... Cs>
    void Spawn(Cs&&... components) {
        m_ops.emplace_back(
            [bundle = std::make_tuple(std::decay_t<Cs>(std::forward<Cs>(components))...)]
            (Registry& reg) {
                std::apply([&reg](const auto&... c) { SpawnInto(reg, c...); }, bundle);
            });
    }

    void Destroy(EntityId id);

    template<typename T>
    void Add(EntityId id, T component) {
        m_ops.emplace_back([id, component](Registry& reg) { AddInto(reg, id, component); });
    }

    template<typename T>
    void Remove(EntityId id) {
        m_ops.emplace_back([id](Registry& reg) { RemoveFrom<T>(reg, id); });
    }

    // Run every queued change against reg in recording order, then empty
    // the queue. Changes targeting entities that died meanwhile are skipped.
    void Apply(Registry& reg);

    void Clear() noexcept { m_ops.clear(); }

    [[nodiscard]] bool   Empty() const noexcept { return m_ops.empty(); }
    [[nodiscard]] size_t Size()  const noexcept { return m_ops.size(); }

private:
    template<typename... Cs>
    static void SpawnInto(Registry& reg, const Cs&... components);

    template<typename T>
    static void AddInto(Registry& reg, EntityId id, const T& component);

    template<typename T>
    static void RemoveFrom(Registry& reg, EntityId id);

    std::vector<std::function<void(Registry&)>> m_ops;
};

} // namespace Incerto::ECS

#include <ECS/Registry.hpp>

namespace Incerto::ECS {

template<typename... Cs>
void Commands::SpawnInto(Registry& reg, const Cs&... components) {
    reg.Spawn(components...);
}

template<typename T>
void Commands::AddInto(Registry& reg, EntityId id, const T& component) {
    if (!reg.IsAlive(id)) return;
    if (reg.HasComponent<T>(id))
        reg.GetComponent<T>(id) = component;
    else
        reg.AddComponent<T>(id, component);
}

template<typename T>
void Commands::RemoveFrom(Registry& reg, EntityId id) {
    if (reg.IsAlive(id)) reg.RemoveComponent<T>(id);
}

} // namespace Incerto::ECS
