#include <Sim/Simulation.hpp>

#include <raylib.h>

namespace Incerto::Sim {

Simulation::Simulation(Recipe recipe, ECS::Scheduler scheduler)
    : m_recipe(std::move(recipe))
    , m_scheduler(std::move(scheduler))
{
    Populate();
    TraceLog(LOG_INFO, "[sim] simulation ready: %zu entities, %zu systems, %zu workers",
             m_world.EntityCount(), m_scheduler.SystemCount(), m_scheduler.WorkerCount());
}

void Simulation::Populate()
{
    for (const auto& init : m_recipe.initializers)
        init(m_world);
    m_world.InsertResource(StepCounter{});

    m_recipe.spawners.Populate(m_world);

    for (const auto& hook : m_recipe.afterPopulate)
        hook(m_world);
}

void Simulation::Run(size_t steps)
{
    auto& counter = m_world.GetResource<StepCounter>();
    for (size_t i = 0; i < steps; ++i) {
        counter.step = m_steps + 1;
        try {
            m_scheduler.RunStep(m_world);
        } catch (...) {
            counter.step = m_steps;
            TraceLog(LOG_DEBUG, "[sim] step %zu failed, %zu steps completed", m_steps + 1, m_steps);
            throw;
        }
        ++m_steps;
    }
}

void Simulation::Reset()
{
    m_scheduler.DiscardPending();
    m_world.Clear();
    m_steps = 0;
    Populate();
    TraceLog(LOG_DEBUG, "[sim] reset: %zu entities", m_world.EntityCount());
}

void Simulation::RunNew(size_t steps)
{
    Reset();
    Run(steps);
}

} // namespace Incerto::Sim
