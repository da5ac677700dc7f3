#pragma once

#include <ECS/Events.hpp>
#include <ECS/Scheduler.hpp>
#include <ECS/System.hpp>
#include <Sim/Errors.hpp>
#include <Sim/Simulation.hpp>
#include <Sim/SpatialGrid.hpp>
#include <Sim/Spawner.hpp>
#include <Sim/TimeSeries.hpp>

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Incerto::Sim {

// ---------------------------------------------------------------------------
// SimulationBuilder: accumulates the recipe of an experiment.
//
//   auto sim = SimulationBuilder()
//       .AddEntitySpawner([](Spawner& s) {
//           for (int i = 0; i < 100; ++i) s.Spawn(Counter{0});
//       })
//       .AddSystems([](ECS::Query<Counter> q) {
//           q.Each([](ECS::EntityId, Counter& c) { ++c.value; });
//       })
//       .Build();
//
// Spawners run in the order they were added. Systems are handed to the
// scheduler in the order they were added; those that conflict keep that
// order, others may run concurrently or interleave across AddSystems calls.
// ---------------------------------------------------------------------------
class SimulationBuilder {
public:
    SimulationBuilder() = default;

    SimulationBuilder& AddEntitySpawner(SpawnFn spawner);

    // One or more systems for the Update stage. Each argument is either a
    // std::unique_ptr<ECS::System> or a callable taking system parameters
    // (it is then named "system#N").
    template<typename... Ss>
    SimulationBuilder& AddSystems(Ss&&... systems) {
        static_assert(sizeof...(Ss) > 0, "AddSystems needs at least one system");
        (AddOne(std::forward<Ss>(systems)), ...);
        return *this;
    }

    SimulationBuilder& AddSystem(std::unique_ptr<ECS::System> system,
                                 ECS::Stage stage = ECS::Stage::Update);

    template<typename Fn>
    SimulationBuilder& AddSystem(std::string name, Fn&& fn, ECS::Stage stage = ECS::Stage::Update) {
        return AddSystem(ECS::MakeSystem(std::move(name), std::forward<Fn>(fn)), stage);
    }

    // Resource inserted before the spawners run, on build and on every
    // reset, so it always starts from this value.
    template<typename R>
    SimulationBuilder& AddResource(R value) {
        m_recipe.initializers.push_back(
            [value = std::move(value)](ECS::Registry& reg) { reg.InsertResource<R>(value); });
        return *this;
    }

    // 0 = hardware concurrency, 1 = run every system on the calling thread.
    SimulationBuilder& SetWorkerThreads(size_t workers);

    // Record Aggregator<C, O> over every C passing Fs at the end of every
    // sampleInterval-th step.
    template<typename C, typename O, typename... Fs>
    SimulationBuilder& RecordAggregateTimeSeries(size_t sampleInterval) {
        using Series = AggregateSeries<C, O, Fs...>;
        CheckSampleInterval(sampleInterval);
        ClaimSeries(std::type_index(typeid(Series)));

        m_recipe.initializers.push_back([sampleInterval](ECS::Registry& reg) {
            reg.InsertResource(Series{ TimeSeries<O>(sampleInterval) });
        });
        AddInternalSystem(MakeAggregateRecorder<C, O, Fs...>(), ECS::Stage::PostUpdate);
        return *this;
    }

    // Record Sampler<C, O> of every entity carrying identifier I, one series
    // per identifier value, at the end of every sampleInterval-th step.
    template<typename C, typename I, typename O>
    SimulationBuilder& RecordTimeSeries(size_t sampleInterval) {
        using Series = IdentifiedSeries<C, I, O>;
        CheckSampleInterval(sampleInterval);
        ClaimSeries(std::type_index(typeid(Series)));

        m_recipe.initializers.push_back([sampleInterval](ECS::Registry& reg) {
            Series series;
            series.interval = sampleInterval;
            reg.InsertResource(std::move(series));
        });
        AddInternalSystem(MakeIdentifiedRecorder<C, I, O>(), ECS::Stage::PostUpdate);
        return *this;
    }

    // Maintain a SpatialGrid<Coord, C> resource over every entity owning a
    // GridPosition<Coord> and a C. Adding the same grid twice keeps the first.
    template<typename Coord, typename C>
    SimulationBuilder& AddSpatialGrid(std::optional<GridBounds<Coord>> bounds = std::nullopt) {
        if (!ClaimGrid(std::type_index(typeid(SpatialGrid<Coord, C>)))) return *this;

        m_recipe.initializers.push_back([bounds](ECS::Registry& reg) {
            reg.InsertResource(SpatialGrid<Coord, C>(bounds));
        });
        m_recipe.afterPopulate.push_back(&RebuildSpatialGrid<Coord, C>);
        AddInternalSystem(MakeSpatialGridIndexer<Coord, C>(), ECS::Stage::PreUpdate);
        return *this;
    }

    // Make Events<E> available to EventReader<E> and EventWriter<E> system
    // parameters. The buffers swap at the start of every step, before any
    // other system, and start empty on build and on every reset. Registering
    // the same event type again has no effect.
    template<typename E>
    SimulationBuilder& RegisterEvent() {
        if (!m_claimed.insert(std::type_index(typeid(ECS::Events<E>))).second) return *this;

        m_recipe.initializers.push_back([](ECS::Registry& reg) { reg.InsertResource(ECS::Events<E>{}); });
        auto updater = ECS::MakeSystem(std::string("events:") + typeid(E).name(),
                                       [](ECS::ResMut<ECS::Events<E>> events) { events->Update(); });
        m_systems.insert(m_systems.begin(), PendingSystem{ std::move(updater), ECS::Stage::PreUpdate });
        return *this;
    }

    // Consume the recipe and create the simulation with its initial
    // population. The builder is left empty, also when a spawner throws.
    // Throws ConfigurationError (EmptyRecipe) if neither a spawner nor a
    // system was added.
    [[nodiscard]] Simulation Build();

private:
    void AddOne(std::unique_ptr<ECS::System> system) { AddSystem(std::move(system)); }

    template<typename Fn,
             typename = std::enable_if_t<!std::is_convertible_v<Fn, std::unique_ptr<ECS::System>>>>
    void AddOne(Fn&& fn) {
        AddSystem(NextSystemName(), std::forward<Fn>(fn));
    }

    // Harness systems (recorders, grid indexers, event updaters) do not make
    // a recipe non-empty.
    void AddInternalSystem(std::unique_ptr<ECS::System> system, ECS::Stage stage);

    std::string NextSystemName();

    static void CheckSampleInterval(size_t sampleInterval);
    void ClaimSeries(std::type_index series);
    bool ClaimGrid(std::type_index grid);

    struct PendingSystem {
        std::unique_ptr<ECS::System> system;
        ECS::Stage stage;
    };

    Recipe m_recipe;
    std::vector<PendingSystem> m_systems;
    size_t m_userSystems = 0;
    size_t m_workers     = 0;
    std::unordered_set<std::type_index> m_claimed;
};

} // namespace Incerto::Sim
