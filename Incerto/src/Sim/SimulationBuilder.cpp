#include <Sim/SimulationBuilder.hpp>

#include <raylib.h>

#include <stdexcept>

namespace Incerto::Sim {

SimulationBuilder& SimulationBuilder::AddEntitySpawner(SpawnFn spawner)
{
    m_recipe.spawners.Add(std::move(spawner));
    return *this;
}

SimulationBuilder& SimulationBuilder::AddSystem(std::unique_ptr<ECS::System> system, ECS::Stage stage)
{
    if (!system) throw std::invalid_argument("SimulationBuilder::AddSystem: null system");
    m_systems.push_back({ std::move(system), stage });
    ++m_userSystems;
    return *this;
}

SimulationBuilder& SimulationBuilder::SetWorkerThreads(size_t workers)
{
    m_workers = workers;
    return *this;
}

void SimulationBuilder::AddInternalSystem(std::unique_ptr<ECS::System> system, ECS::Stage stage)
{
    m_systems.push_back({ std::move(system), stage });
}

std::string SimulationBuilder::NextSystemName()
{
    return "system#" + std::to_string(m_userSystems);
}

void SimulationBuilder::CheckSampleInterval(size_t sampleInterval)
{
    if (sampleInterval == 0)
        throw ConfigurationError(ConfigurationError::Reason::InvalidSampleInterval,
                                 "time series sample interval must be at least 1");
}

void SimulationBuilder::ClaimSeries(std::type_index series)
{
    if (!m_claimed.insert(series).second)
        throw ConfigurationError(ConfigurationError::Reason::TimeSeriesRecordingConflict,
                                 std::string("time series already recorded: ") + series.name());
}

bool SimulationBuilder::ClaimGrid(std::type_index grid)
{
    if (m_claimed.insert(grid).second) return true;
    TraceLog(LOG_WARNING, "[sim] spatial grid %s added twice, keeping the first", grid.name());
    return false;
}

Simulation SimulationBuilder::Build()
{
    if (m_recipe.spawners.Empty() && m_userSystems == 0)
        throw ConfigurationError(ConfigurationError::Reason::EmptyRecipe,
                                 "simulation has no entity spawners and no systems");

    // Take the recipe first so a throwing spawner still leaves the builder empty.
    Recipe recipe = std::move(m_recipe);
    std::vector<PendingSystem> systems = std::move(m_systems);
    const size_t userSystems = m_userSystems;
    const size_t workers     = m_workers;

    m_recipe      = Recipe{};
    m_systems.clear();
    m_userSystems = 0;
    m_workers     = 0;
    m_claimed.clear();

    ECS::Scheduler scheduler(workers);
    for (auto& pending : systems)
        scheduler.AddSystem(std::move(pending.system), pending.stage);

    TraceLog(LOG_DEBUG, "[sim] building: %zu spawners, %zu user systems, %zu harness systems",
             recipe.spawners.Size(), userSystems, systems.size() - userSystems);

    return Simulation(std::move(recipe), std::move(scheduler));
}

} // namespace Incerto::Sim
