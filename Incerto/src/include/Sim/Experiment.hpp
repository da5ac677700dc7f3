#pragma once

#include <Sim/Simulation.hpp>

#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace Incerto::Sim {

// Called after each completed run with (runs done, runs total).
using ProgressCallback = std::function<void(size_t, size_t)>;

namespace detail {
void LogExperiment(size_t runs, size_t steps);
} // namespace detail

// Repeat RunNew(steps) `runs` times and collect observe(sim) after each run.
// Every run starts from a freshly spawned population.
template<typename Fn>
auto RunExperiment(Simulation& sim, size_t runs, size_t steps, Fn&& observe,
                   const ProgressCallback& progress = {})
    -> std::vector<std::decay_t<std::invoke_result_t<Fn&, const Simulation&>>>
{
    std::vector<std::decay_t<std::invoke_result_t<Fn&, const Simulation&>>> results;
    results.reserve(runs);
    detail::LogExperiment(runs, steps);

    for (size_t r = 0; r < runs; ++r) {
        sim.RunNew(steps);
        results.push_back(observe(std::as_const(sim)));
        if (progress) progress(r + 1, runs);
    }
    return results;
}

// Descriptive statistics of a set of per-run observations.
struct Summary {
    size_t count  = 0;
    double mean   = 0.0;
    double median = 0.0;
    double stdDev = 0.0; // sample standard deviation (n - 1), 0 for one sample
    double min    = 0.0;
    double max    = 0.0;
    // Normal approximation: mean -/+ 1.96 * stdDev / sqrt(count).
    double ciLower95 = 0.0;
    double ciUpper95 = 0.0;
};

// Throws std::invalid_argument on an empty input.
[[nodiscard]] Summary Summarize(const std::vector<double>& samples);

} // namespace Incerto::Sim
