#pragma once

#include <ECS/Registry.hpp>
#include <ECS/Scheduler.hpp>
#include <Sim/Errors.hpp>
#include <Sim/Observe.hpp>
#include <Sim/Spawner.hpp>
#include <Sim/StepCounter.hpp>
#include <Sim/TimeSeries.hpp>

#include <functional>
#include <string>
#include <typeinfo>
#include <vector>

namespace Incerto::Sim {

// Everything needed to (re)create the initial population of a simulation.
struct Recipe {
    SpawnerRegistry spawners;

    // Run on the empty registry before the spawners: resource inserts.
    std::vector<std::function<void(ECS::Registry&)>> initializers;

    // Run after the spawners: indexes that depend on the population.
    std::vector<std::function<void(ECS::Registry&)>> afterPopulate;
};

// ---------------------------------------------------------------------------
// Simulation: one experiment instance, created by SimulationBuilder::Build.
//
//   sim.Run(10);                              // advance ten steps
//   sim.ObserveMany<Counter>();               // reduce every Counter
//   sim.RunNew(10);                           // fresh population, ten steps
//
// A Simulation exclusively owns its population. It is movable but not
// copyable, and must not be driven from two threads at once; systems still
// run in parallel inside each step.
// ---------------------------------------------------------------------------
class Simulation {
public:
    Simulation(Simulation&&)                     = default;
    Simulation& operator=(Simulation&&)          = default;
    Simulation(const Simulation&)                = delete;
    Simulation& operator=(const Simulation&)     = delete;

    // -----------------------------------------------------------------------
    // Lifecycle
    // -----------------------------------------------------------------------

    // Advance `steps` steps. If a step throws, the exception propagates,
    // later steps are not attempted and StepCount() counts only the steps
    // that completed.
    void Run(size_t steps);

    // Destroy every entity, replay the recipe and set the step count to 0.
    // Registered systems are kept.
    void Reset();

    // Reset() followed by Run(steps).
    void RunNew(size_t steps);

    // Steps completed since construction or the last reset.
    [[nodiscard]] size_t StepCount() const noexcept { return m_steps; }

    [[nodiscard]] size_t EntityCount() const noexcept { return m_world.EntityCount(); }

    // -----------------------------------------------------------------------
    // Observation (read-only)
    // -----------------------------------------------------------------------

    // Entities carrying C and passing every filter in Fs. Zero is valid.
    template<typename C, typename... Fs>
    [[nodiscard]] size_t Count() const {
        return m_world.Count<C, Fs...>();
    }

    // SingleObservable<C> applied to the one entity carrying C.
    template<typename C>
    [[nodiscard]] typename SingleObservable<C>::Out ObserveSingle() const {
        static_assert(IsSingleObservable<C>::value,
                      "ObserveSingle<C> needs a SingleObservable<C> specialization");
        const Records<C> records = Collect<C>();
        RequireUnique<C>(records.size());
        return SingleObservable<C>::Observe(*records.front());
    }

    // ManyObservable<C> applied to every entity carrying C.
    template<typename C>
    [[nodiscard]] typename ManyObservable<C>::Out ObserveMany() const {
        static_assert(IsManyObservable<C>::value,
                      "ObserveMany<C> needs a ManyObservable<C> specialization");
        const Records<C> records = Collect<C>();
        if (records.empty())
            throw ObservationError(ObservationError::Kind::NotFound,
                                   std::string("ObserveMany: no entity carries ") + typeid(C).name());
        return ManyObservable<C>::Observe(records);
    }

    // Sampler<C, O> applied to the one entity whose identifier record I
    // equals id.
    template<typename C, typename O, typename I>
    [[nodiscard]] O Sample(const I& id) const {
        static_assert(IsSampleable<C, O>::value, "Sample<C, O> needs a Sampler<C, O> specialization");
        const C* found = nullptr;
        size_t matches = 0;
        m_world.View<const C, const I>([&](ECS::EntityId, const C& c, const I& ident) {
            if (!(ident == id)) return;
            found = &c;
            ++matches;
        });
        RequireUnique<C>(matches);
        return Sampler<C, O>::Sample(*found);
    }

    // Aggregator<C, O> over every C passing Fs; the collection may be empty.
    template<typename C, typename O, typename... Fs>
    [[nodiscard]] O SampleAggregate() const {
        static_assert(IsAggregatable<C, O>::value,
                      "SampleAggregate<C, O> needs an Aggregator<C, O> specialization");
        return Aggregator<C, O>::Aggregate(Collect<C, Fs...>());
    }

    // Series registered with RecordAggregateTimeSeries<C, O, Fs...>.
    // The reference is invalidated by Reset() and RunNew().
    template<typename C, typename O, typename... Fs>
    [[nodiscard]] const TimeSeries<O>& AggregateTimeSeries() const {
        return GetResource<AggregateSeries<C, O, Fs...>>().series;
    }

    // Series of the entity identified by id, registered with
    // RecordTimeSeries<C, I, O>. Throws NotFound if that entity was never
    // sampled. The reference is invalidated by Reset() and RunNew().
    template<typename C, typename I, typename O>
    [[nodiscard]] const TimeSeries<O>& TimeSeriesOf(const I& id) const {
        const auto& recorded = GetResource<IdentifiedSeries<C, I, O>>();
        const auto it = recorded.series.find(id);
        if (it == recorded.series.end())
            throw ObservationError(ObservationError::Kind::NotFound,
                                   std::string("TimeSeriesOf: no samples for this ") + typeid(I).name());
        return it->second;
    }

    // Throws ObservationError (NotFound) if R was never added.
    template<typename R>
    [[nodiscard]] const R& GetResource() const {
        const R* r = m_world.TryGetResource<R>();
        if (!r)
            throw ObservationError(ObservationError::Kind::NotFound,
                                   std::string("GetResource: no resource ") + typeid(R).name());
        return *r;
    }

    [[nodiscard]] const ECS::Registry&  World()        const noexcept { return m_world; }
    [[nodiscard]] const ECS::Scheduler& GetScheduler() const noexcept { return m_scheduler; }

private:
    friend class SimulationBuilder;

    Simulation(Recipe recipe, ECS::Scheduler scheduler);

    void Populate();

    template<typename C, typename... Fs>
    Records<C> Collect() const {
        Records<C> records;
        m_world.View<const C, Fs...>([&records](ECS::EntityId, const C& c) { records.push_back(&c); });
        return records;
    }

    template<typename C>
    static void RequireUnique(size_t matches) {
        if (matches == 0)
            throw ObservationError(ObservationError::Kind::NotFound,
                                   std::string("no entity carries ") + typeid(C).name());
        if (matches > 1)
            throw ObservationError(ObservationError::Kind::Ambiguous,
                                   std::to_string(matches) + " entities carry " + typeid(C).name());
    }

    Recipe         m_recipe;
    ECS::Registry  m_world;
    ECS::Scheduler m_scheduler;
    size_t         m_steps = 0;
};

} // namespace Incerto::Sim
