#include <Sim/Experiment.hpp>

#include <raylib.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace Incerto::Sim {

namespace detail {

void LogExperiment(size_t runs, size_t steps)
{
    TraceLog(LOG_INFO, "[sim] experiment: %zu runs of %zu steps", runs, steps);
}

} // namespace detail

Summary Summarize(const std::vector<double>& samples)
{
    if (samples.empty())
        throw std::invalid_argument("Summarize: no samples");

    Summary s;
    s.count = samples.size();
    const double n = static_cast<double>(s.count);
    s.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / n;

    double sq = 0.0;
    for (const double v : samples) {
        const double d = v - s.mean;
        sq += d * d;
    }
    s.stdDev = s.count > 1 ? std::sqrt(sq / (n - 1.0)) : 0.0;

    std::vector<double> sorted = samples;
    std::sort(sorted.begin(), sorted.end());
    s.min = sorted.front();
    s.max = sorted.back();

    const size_t mid = sorted.size() / 2;
    s.median = sorted.size() % 2 == 1 ? sorted[mid] : 0.5 * (sorted[mid - 1] + sorted[mid]);

    const double half = 1.96 * s.stdDev / std::sqrt(n);
    s.ciLower95 = s.mean - half;
    s.ciUpper95 = s.mean + half;
    return s;
}

} // namespace Incerto::Sim
