#include <cmath>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include <ECS/ECS.hpp>
#include <Sim/Experiment.hpp>
#include <Sim/SimulationBuilder.hpp>

#include "TestSupport.hpp"

using namespace Incerto;
using namespace Incerto::Sim;

namespace {

struct Coin { bool heads = false; };

} // namespace

// Each run spawns 100 coins and flips every coin once per step.
static Simulation makeCoinSim(unsigned seed) {
    auto rng = std::make_shared<std::mt19937>(seed);
    return SimulationBuilder()
        .AddEntitySpawner([rng](Spawner& s) {
            std::bernoulli_distribution flip(0.5);
            for (int i = 0; i < 100; ++i) s.Spawn(Coin{ flip(*rng) });
        })
        .AddSystems([](ECS::Query<Coin> q) {
            q.Each([](ECS::EntityId, Coin& c) { c.heads = !c.heads; });
        })
        .SetWorkerThreads(1)
        .Build();
}

static double headsFraction(const Simulation& sim) {
    size_t heads = 0;
    sim.World().View<const Coin>([&heads](ECS::EntityId, const Coin& c) { heads += c.heads ? 1 : 0; });
    return static_cast<double>(heads) / static_cast<double>(sim.Count<Coin>());
}

static void runExperimentCollectsEveryRun() {
    auto sim = makeCoinSim(7);

    std::vector<size_t> progress;
    const auto results = RunExperiment(sim, 20, 3, headsFraction,
        [&progress](size_t done, size_t total) {
            REQUIRE(total == 20, "progress total");
            progress.push_back(done);
        });

    REQUIRE(results.size() == 20, "one observation per run");
    REQUIRE(progress.size() == 20 && progress.front() == 1 && progress.back() == 20, "progress per run");
    REQUIRE(sim.StepCount() == 3, "last run left at its final step");
    REQUIRE(sim.EntityCount() == 100, "each run starts from a fresh population");

    bool differs = false;
    for (double r : results) {
        REQUIRE(r >= 0.0 && r <= 1.0, "fraction out of range: " << r);
        differs = differs || r != results.front();
    }
    REQUIRE(differs, "runs draw different populations");

    const Summary s = Summarize(results);
    REQUIRE(s.count == 20, "summary count");
    REQUIRE(s.min <= s.mean && s.mean <= s.max, "mean inside [min, max]");
    REQUIRE(s.ciLower95 <= s.mean && s.mean <= s.ciUpper95, "mean inside its interval");
    REQUIRE(std::fabs(s.mean - 0.5) < 0.1, "fair coins average near one half, got " << s.mean);

    pass("RunExperiment collects one observation per run");
}

static void runExperimentObservesIntegers() {
    auto sim = SimulationBuilder()
        .AddEntitySpawner([](Spawner& s) { s.Spawn(Coin{}); s.Spawn(Coin{}); })
        .Build();

    const auto counts = RunExperiment(sim, 3, 5,
        [](const Simulation& s) { return s.Count<Coin>() + s.StepCount(); });
    REQUIRE((counts == std::vector<size_t>{ 7, 7, 7 }), "observe result type is kept");

    REQUIRE(RunExperiment(sim, 0, 5, [](const Simulation&) { return 1; }).empty(), "zero runs");

    pass("RunExperiment with integer observations");
}

static void runSummarize() {
    const Summary s = Summarize({ 2, 4, 4, 4, 5, 5, 7, 9 });
    const double sd = std::sqrt(32.0 / 7.0);
    const double half = 1.96 * sd / std::sqrt(8.0);

    REQUIRE(s.count == 8, "count");
    REQUIRE(nearly(s.mean, 5.0), "mean " << s.mean);
    REQUIRE(nearly(s.median, 4.5), "even count averages the middle pair, got " << s.median);
    REQUIRE(nearly(s.stdDev, sd), "sample standard deviation " << s.stdDev);
    REQUIRE(nearly(s.min, 2.0) && nearly(s.max, 9.0), "extremes");
    REQUIRE(nearly(s.ciLower95, 5.0 - half) && nearly(s.ciUpper95, 5.0 + half), "95% interval");

    const Summary odd = Summarize({ 3, 1, 2 });
    REQUIRE(nearly(odd.median, 2.0), "odd count takes the middle value");

    const Summary one = Summarize({ 42.0 });
    REQUIRE(nearly(one.stdDev, 0.0) && nearly(one.ciLower95, 42.0) && nearly(one.ciUpper95, 42.0),
            "single sample has no spread");

    REQUIRE_THROWS(Summarize({}), std::invalid_argument, "empty input is rejected");

    pass("Summarize");
}

int main() {
    runExperimentCollectsEveryRun();
    runExperimentObservesIntegers();
    runSummarize();
    return 0;
}
