#include <cstdio>
#include <memory>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <lua.hpp>
#include <raylib.h>

#include <Config/ExperimentConfig.hpp>
#include <ECS/ECS.hpp>
#include <Scripting/LuaLoader/Simulation.hpp>
#include <Sim/Experiment.hpp>
#include <Sim/SimulationBuilder.hpp>

using namespace Incerto;
using namespace Incerto::Sim;

// Forest fire on a 50x50 grid. Burning cells ignite healthy Moore neighbours
// with a fixed probability and burn out after a few steps.
//
//   ForestFire [config.lua] [report.lua]

namespace {

constexpr int    GridSize       = 50;
constexpr double ForestDensity  = 0.7;
constexpr double SpreadChance   = 0.6;
constexpr int    BurnDuration   = 3;
constexpr int    InitialFires   = 3;

enum class CellState { Healthy, Burning, Burned, Empty };

struct ForestCell {
    CellState state    = CellState::Empty;
    int       burnLeft = 0;
};

struct FireRng {
    std::mt19937 engine;
};

struct FireStats {
    size_t healthy = 0;
    size_t burning = 0;
    size_t burned  = 0;
    size_t empty   = 0;

    [[nodiscard]] size_t Total() const noexcept { return healthy + burning + burned + empty; }
};

using ForestGrid = SpatialGrid<GridCoord2, ForestCell>;

} // namespace

namespace Incerto::Sim {

template<>
struct Aggregator<ForestCell, FireStats> {
    static FireStats Aggregate(const Records<ForestCell>& cells) {
        FireStats s;
        for (const ForestCell* c : cells) {
            switch (c->state) {
                case CellState::Healthy: ++s.healthy; break;
                case CellState::Burning: ++s.burning; break;
                case CellState::Burned:  ++s.burned;  break;
                case CellState::Empty:   ++s.empty;   break;
            }
        }
        return s;
    }
};

} // namespace Incerto::Sim

namespace {

// Shared across resets so every run draws a different forest.
void spawnForest(Spawner& s, std::mt19937& rng) {
    std::bernoulli_distribution tree(ForestDensity);
    std::uniform_int_distribution<int> cell(0, GridSize - 1);

    std::unordered_set<GridCoord2> fires;
    while (fires.size() < static_cast<size_t>(InitialFires))
        fires.insert(GridCoord2{ cell(rng), cell(rng) });

    for (int x = 0; x < GridSize; ++x) {
        for (int y = 0; y < GridSize; ++y) {
            ForestCell c;
            if (fires.count(GridCoord2{ x, y })) {
                c.state    = CellState::Burning;
                c.burnLeft = BurnDuration;
            } else if (tree(rng)) {
                c.state = CellState::Healthy;
            }
            s.Spawn(c, GridPosition2D{ { x, y } });
        }
    }
}

void spreadFire(ECS::Query<const GridPosition2D, const ForestCell> cells,
                ECS::Res<ForestGrid> grid,
                ECS::ResMut<FireRng> rng,
                ECS::Commands& cmd) {
    std::unordered_map<ECS::EntityId, CellState> states;
    std::vector<GridPosition2D> burning;
    cells.Each([&](ECS::EntityId id, const GridPosition2D& pos, const ForestCell& c) {
        states.emplace(id, c.state);
        if (c.state == CellState::Burning) burning.push_back(pos);
    });

    std::bernoulli_distribution spread(SpreadChance);
    std::unordered_set<ECS::EntityId> ignited;
    for (const GridPosition2D& pos : burning) {
        for (const ECS::EntityId n : grid->NeighborsOf(pos)) {
            const auto it = states.find(n);
            if (it != states.end() && it->second == CellState::Healthy && spread(rng->engine))
                ignited.insert(n);
        }
    }
    for (const ECS::EntityId id : ignited)
        cmd.Add(id, ForestCell{ CellState::Burning, BurnDuration });
}

void burnDown(ECS::Query<ForestCell> cells) {
    cells.Each([](ECS::EntityId, ForestCell& c) {
        if (c.state == CellState::Burning && --c.burnLeft <= 0)
            c.state = CellState::Burned;
    });
}

double burnedFraction(const Simulation& sim) {
    const FireStats s = sim.SampleAggregate<ForestCell, FireStats>();
    return s.Total() ? static_cast<double>(s.burned) / static_cast<double>(s.Total()) : 0.0;
}

int runReport(Simulation& sim, const char* script) {
    namespace LL = Scripting::LuaLoader;
    LL::setSimulation(&sim);
    LL::registerObservable("burned", burnedFraction);
    LL::registerObservable("burning", [](const Simulation& s) {
        return static_cast<double>(s.SampleAggregate<ForestCell, FireStats>().burning);
    });

    lua_State* L = luaL_newstate();
    luaL_openlibs(L);
    LL::registerSimulation(L);

    int status = 0;
    if (luaL_dofile(L, script) != LUA_OK) {
        TraceLog(LOG_ERROR, "[lua] %s", lua_tostring(L, -1));
        status = 1;
    }
    lua_close(L);
    LL::setSimulation(nullptr);
    return status;
}

} // namespace

int main(int argc, char** argv) {
    Config::ExperimentConfig cfg;
    try {
        if (argc > 1) cfg = Config::LoadExperimentConfig(argv[1]);
        Config::ApplyLogLevel(cfg);
    } catch (const ConfigurationError& e) {
        std::fprintf(stderr, "configuration error (%s): %s\n", ToString(e.reason()), e.what());
        return 1;
    }

    auto rng = std::make_shared<std::mt19937>(std::random_device{}());

    auto sim = SimulationBuilder()
        .AddEntitySpawner([rng](Spawner& s) { spawnForest(s, *rng); })
        .AddResource(FireRng{ std::mt19937(std::random_device{}()) })
        .AddSpatialGrid<GridCoord2, ForestCell>(GridBounds<GridCoord2>{ { 0, 0 }, { GridSize - 1, GridSize - 1 } })
        .AddSystem("spread-fire", spreadFire)
        .AddSystem("burn-down", burnDown)
        .RecordAggregateTimeSeries<ForestCell, FireStats>(1)
        .SetWorkerThreads(cfg.workers)
        .Build();

    const auto results = RunExperiment(sim, cfg.runs, cfg.steps, burnedFraction,
        [](size_t done, size_t total) { TraceLog(LOG_INFO, "[sim] run %zu/%zu", done, total); });

    if (!results.empty()) {
        const Summary s = Summarize(results);
        std::printf("burned fraction over %zu runs: mean %.3f  median %.3f  sd %.3f  95%% CI [%.3f, %.3f]\n",
                    s.count, s.mean, s.median, s.stdDev, s.ciLower95, s.ciUpper95);

        size_t peak = 0, peakStep = 0;
        const auto& series = sim.AggregateTimeSeries<ForestCell, FireStats>();
        for (size_t i = 0; i < series.Size(); ++i) {
            if (series[i].burning > peak) {
                peak     = series[i].burning;
                peakStep = series.StepAt(i);
            }
        }
        std::printf("last run: peak of %zu burning cells at step %zu\n", peak, peakStep);
    }

    return argc > 2 ? runReport(sim, argv[2]) : 0;
}
