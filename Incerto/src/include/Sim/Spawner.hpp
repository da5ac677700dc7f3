#pragma once

#include <ECS/Registry.hpp>

#include <functional>
#include <utility>
#include <vector>

namespace Incerto::Sim {

// Handed to an entity spawner while a population is built. Each Spawn call
// creates one entity owning exactly the given bundle of records.
class Spawner {
public:
    explicit Spawner(ECS::Registry& reg) noexcept : m_reg(&reg) {}

    template<typename... Cs>
    ECS::EntityId Spawn(Cs&&... components) {
        ++m_spawned;
        return m_reg->Spawn(std::forward<Cs>(components)...);
    }

    [[nodiscard]] size_t Spawned() const noexcept { return m_spawned; }

private:
    ECS::Registry* m_reg;
    size_t m_spawned = 0;
};

using SpawnFn = std::function<void(Spawner&)>;

// Ordered list of spawners. Populate runs every spawner once, in the order
// they were added, against an empty registry.
class SpawnerRegistry {
public:
    void Add(SpawnFn spawner);

    // Returns the number of entities created.
    size_t Populate(ECS::Registry& reg) const;

    [[nodiscard]] size_t Size()  const noexcept { return m_spawners.size(); }
    [[nodiscard]] bool   Empty() const noexcept { return m_spawners.empty(); }

private:
    std::vector<SpawnFn> m_spawners;
};

} // namespace Incerto::Sim
