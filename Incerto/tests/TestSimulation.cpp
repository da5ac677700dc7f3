#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <ECS/ECS.hpp>
#include <Sim/Aggregate.hpp>
#include <Sim/Errors.hpp>
#include <Sim/Simulation.hpp>
#include <Sim/SimulationBuilder.hpp>

#include "TestSupport.hpp"

using namespace Incerto;
using namespace Incerto::Sim;

namespace {

struct Counter { size_t value = 0; };
struct GroupA  {};
struct GroupB  {};
struct CounterId { int id = 0; bool operator==(const CounterId& o) const { return id == o.id; } };

struct Clock { size_t ticks = 0; };
struct StepLog { std::vector<size_t> seen; };
struct Budget  { int remaining = 3; };

// Moves freely; any copy throws, so applying a queued spawn fails.
struct Bomb {
    Bomb() = default;
    Bomb(Bomb&&) noexcept            = default;
    Bomb& operator=(Bomb&&) noexcept = default;
    Bomb(const Bomb&) { throw std::runtime_error("bomb copied"); }
    Bomb& operator=(const Bomb&) { throw std::runtime_error("bomb copied"); }
};

} // namespace

namespace Incerto::Sim {

template<>
struct ManyObservable<Counter> {
    using Out = size_t;
    static Out Observe(const Records<Counter>& records) {
        Out sum = 0;
        for (const auto* c : records) sum += c->value;
        return sum;
    }
};

template<>
struct SingleObservable<Clock> {
    using Out = size_t;
    static Out Observe(const Clock& c) { return c.ticks; }
};

template<>
struct Sampler<Counter, size_t> {
    static size_t Sample(const Counter& c) { return c.value; }
};

template<>
struct Aggregator<Counter, size_t> {
    static size_t Aggregate(const Records<Counter>& records) {
        size_t sum = 0;
        for (const auto* c : records) sum += c->value;
        return sum;
    }
};

} // namespace Incerto::Sim

static void incrementCounters(ECS::Query<Counter> q) {
    q.Each([](ECS::EntityId, Counter& c) { ++c.value; });
}

static void spawnHundredCounters(Spawner& s) {
    for (int i = 0; i < 100; ++i) s.Spawn(Counter{0});
}

static void runCounterExample() {
    auto sim = SimulationBuilder()
        .AddEntitySpawner(spawnHundredCounters)
        .AddSystems(incrementCounters)
        .Build();

    REQUIRE(sim.StepCount() == 0, "fresh simulation starts at step 0");
    REQUIRE(sim.ObserveMany<Counter>() == 0, "counters start at 0");
    REQUIRE(sim.Count<Counter>() == 100, "100 counters spawned");

    sim.Run(10);
    REQUIRE(sim.ObserveMany<Counter>() == 1000, "sum after 10 steps");
    REQUIRE(sim.StepCount() == 10, "step count after run(10)");

    sim.Reset();
    REQUIRE(sim.ObserveMany<Counter>() == 0, "sum after reset");
    REQUIRE(sim.StepCount() == 0, "step count after reset");
    REQUIRE(sim.Count<Counter>() == 100, "reset respawns the same population");

    sim.Run(0);
    REQUIRE(sim.StepCount() == 0, "run(0) is a no-op");

    sim.Run(4);
    sim.Run(6);
    REQUIRE(sim.StepCount() == 10, "step counts add up across runs");

    sim.RunNew(7);
    REQUIRE(sim.StepCount() == 7 && sim.ObserveMany<Counter>() == 700, "runNew = reset + run");

    pass("Simulation counter example");
}

static void runSingleCounter() {
    auto sim = SimulationBuilder()
        .AddEntitySpawner([](Spawner& s) { s.Spawn(Counter{0}); })
        .AddSystems(incrementCounters)
        .Build();

    sim.Run(100);
    REQUIRE(sim.ObserveMany<Counter>() == 100, "single counter reaches 100");
    pass("Simulation single counter");
}

static void runGroupsAndFilters() {
    auto sim = SimulationBuilder()
        .AddEntitySpawner([](Spawner& s) {
            for (int i = 0; i < 50; ++i) s.Spawn(Counter{0}, GroupA{});
            for (int i = 0; i < 50; ++i) s.Spawn(Counter{0}, GroupB{});
        })
        .AddSystems(
            [](ECS::Query<Counter, ECS::With<GroupA>> q) {
                q.Each([](ECS::EntityId, Counter& c) { c.value += 2; });
            },
            [](ECS::Query<Counter, ECS::With<GroupB>> q) {
                q.Each([](ECS::EntityId, Counter& c) { c.value += 1; });
            })
        .Build();

    sim.Run(100);
    REQUIRE((sim.SampleAggregate<Counter, size_t>() == 15000), "all counters");
    REQUIRE((sim.SampleAggregate<Counter, size_t, ECS::With<GroupA>>() == 10000), "group A");
    REQUIRE((sim.SampleAggregate<Counter, size_t, ECS::With<GroupB>>() == 5000), "group B");
    REQUIRE((sim.Count<Counter, ECS::With<GroupA>>() == 50), "filtered count");
    REQUIRE((sim.Count<Counter, ECS::Without<GroupA>>() == 50), "negative filter count");

    pass("Simulation groups + filtered aggregates");
}

static void runObservationErrors() {
    auto sim = SimulationBuilder()
        .AddSystems([](ECS::Query<Counter>) {})
        .Build();

    REQUIRE(sim.Count<Counter>() == 0, "count of an absent type is zero");

    bool notFound = false;
    try {
        (void)sim.ObserveMany<Counter>();
    } catch (const ObservationError& e) {
        notFound = e.kind() == ObservationError::Kind::NotFound;
    }
    REQUIRE(notFound, "ObserveMany over zero entities is NotFound");

    notFound = false;
    try {
        (void)sim.ObserveSingle<Clock>();
    } catch (const ObservationError& e) {
        notFound = e.kind() == ObservationError::Kind::NotFound;
    }
    REQUIRE(notFound, "ObserveSingle over zero entities is NotFound");

    REQUIRE((sim.SampleAggregate<Counter, size_t>() == 0), "aggregators accept an empty collection");
    REQUIRE((!sim.SampleAggregate<Counter, std::optional<Mean<size_t>>>().has_value()),
            "built-in statistic over nothing is nullopt");

    pass("Simulation observation errors");
}

static void runObserveSingle() {
    auto one = SimulationBuilder()
        .AddEntitySpawner([](Spawner& s) { s.Spawn(Clock{}); })
        .AddSystems([](ECS::Query<Clock> q) { q.Each([](ECS::EntityId, Clock& c) { ++c.ticks; }); })
        .Build();
    one.Run(3);
    REQUIRE(one.ObserveSingle<Clock>() == 3, "unique clock observed");

    auto two = SimulationBuilder()
        .AddEntitySpawner([](Spawner& s) { s.Spawn(Clock{}); s.Spawn(Clock{}); })
        .Build();

    bool ambiguous = false;
    try {
        (void)two.ObserveSingle<Clock>();
    } catch (const ObservationError& e) {
        ambiguous = e.kind() == ObservationError::Kind::Ambiguous;
    }
    REQUIRE(ambiguous, "two clocks make ObserveSingle ambiguous");

    pass("Simulation ObserveSingle");
}

static void runSampleById() {
    auto sim = SimulationBuilder()
        .AddEntitySpawner([](Spawner& s) {
            s.Spawn(Counter{0}, CounterId{1});
            s.Spawn(Counter{0}, CounterId{5});
            s.Spawn(Counter{0}, CounterId{7});
            s.Spawn(Counter{0}, CounterId{7});
        })
        .AddSystems([](ECS::Query<Counter, const CounterId> q) {
            q.Each([](ECS::EntityId, Counter& c, const CounterId& id) { c.value += static_cast<size_t>(id.id); });
        })
        .Build();

    sim.Run(100);
    REQUIRE((sim.Sample<Counter, size_t>(CounterId{1}) == 100), "counter 1");
    REQUIRE((sim.Sample<Counter, size_t>(CounterId{5}) == 500), "counter 5");
    REQUIRE_THROWS((sim.Sample<Counter, size_t>(CounterId{2})), ObservationError, "unknown id");
    REQUIRE_THROWS((sim.Sample<Counter, size_t>(CounterId{7})), ObservationError, "duplicate id");

    pass("Simulation Sample by identifier");
}

static void runResourcesAndStepCounter() {
    auto sim = SimulationBuilder()
        .AddResource(StepLog{})
        .AddResource(Clock{5})
        .AddSystems([](ECS::Res<StepCounter> step, ECS::ResMut<StepLog> log, ECS::ResMut<Clock> clock) {
            log->seen.push_back(step->step);
            ++clock->ticks;
        })
        .Build();

    sim.Run(3);
    const auto& log = sim.GetResource<StepLog>();
    REQUIRE(log.seen.size() == 3 && log.seen[0] == 1 && log.seen[2] == 3,
            "systems see the 1-based number of the step in flight");
    REQUIRE(sim.GetResource<StepCounter>().step == 3, "counter holds completed steps between runs");
    REQUIRE(sim.GetResource<Clock>().ticks == 8, "resource mutated by a system");

    sim.Reset();
    REQUIRE(sim.GetResource<Clock>().ticks == 5, "reset restores the initial resource value");
    REQUIRE(sim.GetResource<StepLog>().seen.empty(), "reset restores every added resource");
    REQUIRE(sim.GetResource<StepCounter>().step == 0, "reset zeroes the step counter");
    REQUIRE_THROWS(sim.GetResource<Budget>(), ObservationError, "unknown resource");

    pass("Simulation resources + step counter");
}

static void runFailingStep() {
    auto sim = SimulationBuilder()
        .AddResource(Budget{})
        .AddEntitySpawner(spawnHundredCounters)
        .AddSystems(incrementCounters)
        .AddSystem("spend-budget", [](ECS::ResMut<Budget> b) {
            if (b->remaining-- == 0) throw std::runtime_error("budget exhausted");
        })
        .Build();

    REQUIRE_THROWS(sim.Run(10), std::runtime_error, "failing system aborts the run");
    REQUIRE(sim.StepCount() == 3, "only completed steps are counted, got " << sim.StepCount());
    REQUIRE(sim.GetResource<StepCounter>().step == 3, "counter resource rolled back to completed steps");

    sim.RunNew(2);
    REQUIRE(sim.StepCount() == 2 && sim.ObserveMany<Counter>() == 200, "simulation usable after reset");

    pass("Simulation failing step");
}

// A command that throws while being applied must not leave the commands of
// later systems queued for the next step or for a reset population.
static void runFailedCommandsDiscarded() {
    auto armed = std::make_shared<bool>(true);
    auto sim = SimulationBuilder()
        .AddEntitySpawner(spawnHundredCounters)
        .AddSystem("plant-bomb", [armed](ECS::Commands& cmd) {
            if (*armed) cmd.Spawn(Bomb{});
        })
        .AddSystem("clear-counters", [armed](ECS::Query<const Counter> q, ECS::Commands& cmd) {
            if (!*armed) return;
            q.Each([&cmd](ECS::EntityId id, const Counter&) { cmd.Destroy(id); });
        })
        .Build();

    REQUIRE(sim.GetScheduler().Batches(ECS::Stage::Update).size() == 1, "both systems share a batch");

    REQUIRE_THROWS(sim.Run(1), std::runtime_error, "throwing command fails the step");
    REQUIRE(sim.StepCount() == 0, "failed step not counted");
    REQUIRE(sim.Count<Counter>() == 100, "later commands of the failed stage were not applied");

    *armed = false;
    sim.Run(1);
    REQUIRE(sim.Count<Counter>() == 100, "next step applies nothing left over, got " << sim.Count<Counter>());

    *armed = true;
    REQUIRE_THROWS(sim.Run(1), std::runtime_error, "failing again");
    *armed = false;
    sim.Reset();
    REQUIRE(sim.Count<Counter>() == 100, "reset repopulates");
    sim.Run(1);
    REQUIRE(sim.Count<Counter>() == 100 && sim.EntityCount() == 100,
            "no command from before the reset reaches the new population");

    pass("Simulation discards commands of a failed step");
}

static void runSpawnerOrder() {
    auto log = std::make_shared<std::vector<char>>();
    auto sim = SimulationBuilder()
        .AddEntitySpawner([log](Spawner& s) {
            log->push_back('a');
            for (int i = 0; i < 3; ++i) s.Spawn(Counter{}, GroupA{});
        })
        .AddEntitySpawner([log](Spawner& s) {
            log->push_back('b');
            s.Spawn(Counter{}, GroupB{});
            s.Spawn(Counter{}, GroupB{});
        })
        .AddEntitySpawner([log](Spawner& s) {
            log->push_back('c');
            s.Spawn(Clock{});
        })
        .AddSystems(incrementCounters)
        .Build();

    auto checkPopulation = [&sim](const char* when) {
        REQUIRE((sim.Count<Counter, ECS::With<GroupA>>() == 3), "group A archetype " << when);
        REQUIRE((sim.Count<Counter, ECS::With<GroupB>>() == 2), "group B archetype " << when);
        REQUIRE(sim.Count<Clock>() == 1 && sim.EntityCount() == 6, "clock archetype " << when);

        const auto& ids = sim.World().Entities();
        REQUIRE(sim.World().HasComponent<GroupA>(ids[0]) && sim.World().HasComponent<GroupB>(ids[3])
             && sim.World().HasComponent<Clock>(ids[5]), "entities created in spawner order " << when);
    };

    REQUIRE((*log == std::vector<char>{ 'a', 'b', 'c' }), "each spawner ran once, in order");
    checkPopulation("after build");

    sim.Run(4);
    sim.Reset();
    REQUIRE((*log == std::vector<char>{ 'a', 'b', 'c', 'a', 'b', 'c' }), "reset replays the spawners in order");
    checkPopulation("after reset");

    pass("Simulation spawner order");
}

static void runBuildAfterFailedSpawner() {
    SimulationBuilder builder;
    builder.AddEntitySpawner([](Spawner&) { throw std::runtime_error("spawner failed"); })
           .AddSystems(incrementCounters);

    REQUIRE_THROWS(builder.Build(), std::runtime_error, "spawner error propagates out of Build");

    bool empty = false;
    try {
        (void)builder.Build();
    } catch (const ConfigurationError& e) {
        empty = e.reason() == ConfigurationError::Reason::EmptyRecipe;
    }
    REQUIRE(empty, "the failed build consumed the recipe");

    pass("Simulation build after a failed spawner");
}

static void runEmptyRecipe() {
    bool empty = false;
    try {
        (void)SimulationBuilder().Build();
    } catch (const ConfigurationError& e) {
        empty = e.reason() == ConfigurationError::Reason::EmptyRecipe;
    }
    REQUIRE(empty, "empty recipe rejected");

    // Harness-only systems do not count as an update routine.
    bool stillEmpty = false;
    try {
        (void)SimulationBuilder().RecordAggregateTimeSeries<Counter, size_t>(1).Build();
    } catch (const ConfigurationError& e) {
        stillEmpty = e.reason() == ConfigurationError::Reason::EmptyRecipe;
    }
    REQUIRE(stillEmpty, "recorder alone is still an empty recipe");

    auto spawnOnly = SimulationBuilder().AddEntitySpawner(spawnHundredCounters).Build();
    spawnOnly.Run(5);
    REQUIRE(spawnOnly.ObserveMany<Counter>() == 0 && spawnOnly.StepCount() == 5, "spawners alone are valid");

    auto systemsOnly = SimulationBuilder().AddSystems(incrementCounters).Build();
    REQUIRE(systemsOnly.EntityCount() == 0, "systems alone are valid");

    REQUIRE(std::string(ToString(ConfigurationError::Reason::EmptyRecipe)) == "EmptyRecipe", "reason name");
    REQUIRE(std::string(ToString(ObservationError::Kind::Ambiguous)) == "Ambiguous", "kind name");

    pass("Simulation empty recipe");
}

static void runWorkerCounts() {
    for (size_t workers : {size_t(1), size_t(2), size_t(8)}) {
        auto sim = SimulationBuilder()
            .SetWorkerThreads(workers)
            .AddEntitySpawner([](Spawner& s) {
                for (int i = 0; i < 200; ++i) s.Spawn(Counter{0}, GroupA{});
                for (int i = 0; i < 200; ++i) s.Spawn(Counter{0}, GroupB{});
                s.Spawn(Clock{});
            })
            .AddSystems(incrementCounters,
                        [](ECS::Query<Clock> q) { q.Each([](ECS::EntityId, Clock& c) { ++c.ticks; }); })
            .Build();

        REQUIRE(sim.GetScheduler().WorkerCount() == workers, "worker count honoured");
        sim.Run(50);
        REQUIRE(sim.ObserveMany<Counter>() == 400 * 50, "parallel result independent of workers");
        REQUIRE(sim.ObserveSingle<Clock>() == 50, "clock system ran every step");
    }
    pass("Simulation worker counts");
}

int main() {
    runCounterExample();
    runSingleCounter();
    runGroupsAndFilters();
    runObservationErrors();
    runObserveSingle();
    runSampleById();
    runResourcesAndStepCounter();
    runFailingStep();
    runFailedCommandsDiscarded();
    runSpawnerOrder();
    runBuildAfterFailedSpawner();
    runEmptyRecipe();
    runWorkerCounts();
    return 0;
}
