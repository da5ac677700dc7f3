#include <Sim/Spawner.hpp>

#include <raylib.h>

#include <stdexcept>

namespace Incerto::Sim {

void SpawnerRegistry::Add(SpawnFn spawner)
{
    if (!spawner) throw std::invalid_argument("SpawnerRegistry::Add: empty spawner");
    m_spawners.push_back(std::move(spawner));
}

size_t SpawnerRegistry::Populate(ECS::Registry& reg) const
{
    Spawner spawner(reg);
    for (const auto& fn : m_spawners)
        fn(spawner);

    TraceLog(LOG_DEBUG, "[sim] populated %zu entities from %zu spawners",
             spawner.Spawned(), m_spawners.size());
    return spawner.Spawned();
}

} // namespace Incerto::Sim
