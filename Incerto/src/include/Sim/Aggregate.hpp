#pragma once

#include <Sim/Observe.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace Incerto::Sim {

// ---------------------------------------------------------------------------
// Built-in statistics over sampled values.
//
// Any record type C with a Sampler<C, O> can be aggregated into one of the
// wrappers below without writing an Aggregator by hand:
//
//   sim.SampleAggregate<Person, std::optional<Median<double>>>();
//
// Every statistic is optional: an empty population yields std::nullopt.
// Samples that do not compare equal to themselves (NaN) have no order and
// make the reduction throw std::domain_error.
// ---------------------------------------------------------------------------

template<typename O>
struct Minimum {
    O value;
    [[nodiscard]] const O& operator*() const noexcept { return value; }
    bool operator==(const Minimum& o) const { return value == o.value; }
};

template<typename O>
struct Maximum {
    O value;
    [[nodiscard]] const O& operator*() const noexcept { return value; }
    bool operator==(const Maximum& o) const { return value == o.value; }
};

// Arithmetic mean, computed in O.
template<typename O>
struct Mean {
    O value;
    [[nodiscard]] const O& operator*() const noexcept { return value; }
    bool operator==(const Mean& o) const { return value == o.value; }
};

// Element n/2 of the sorted samples (upper median for even n).
template<typename O>
struct Median {
    O value;
    [[nodiscard]] const O& operator*() const noexcept { return value; }
    bool operator==(const Median& o) const { return value == o.value; }
};

// Element floor(P/100 * n) of the sorted samples, clamped to the last one.
template<typename O, unsigned P>
struct Percentile {
    static_assert(P <= 100, "Percentile must lie in [0, 100]");
    static constexpr unsigned Rank = P;

    O value;
    [[nodiscard]] const O& operator*() const noexcept { return value; }
    bool operator==(const Percentile& o) const { return value == o.value; }
};

namespace detail {

template<typename C, typename O>
std::vector<O> CollectSamples(const Records<C>& records) {
    std::vector<O> samples;
    samples.reserve(records.size());
    for (const C* r : records) {
        O s = Sampler<C, O>::Sample(*r);
        if (!(s == s))
            throw std::domain_error("aggregate: sample has no ordering (NaN)");
        samples.push_back(std::move(s));
    }
    return samples;
}

template<typename C, typename O>
std::vector<O> SortedSamples(const Records<C>& records) {
    auto samples = CollectSamples<C, O>(records);
    std::sort(samples.begin(), samples.end());
    return samples;
}

template<typename C, typename O>
using EnableIfSampleable = std::enable_if_t<IsSampleable<C, O>::value>;

} // namespace detail

template<typename C, typename O>
struct Aggregator<C, std::optional<Minimum<O>>, detail::EnableIfSampleable<C, O>> {
    static std::optional<Minimum<O>> Aggregate(const Records<C>& records) {
        const auto samples = detail::CollectSamples<C, O>(records);
        if (samples.empty()) return std::nullopt;
        return Minimum<O>{ *std::min_element(samples.begin(), samples.end()) };
    }
};

template<typename C, typename O>
struct Aggregator<C, std::optional<Maximum<O>>, detail::EnableIfSampleable<C, O>> {
    static std::optional<Maximum<O>> Aggregate(const Records<C>& records) {
        const auto samples = detail::CollectSamples<C, O>(records);
        if (samples.empty()) return std::nullopt;
        return Maximum<O>{ *std::max_element(samples.begin(), samples.end()) };
    }
};

template<typename C, typename O>
struct Aggregator<C, std::optional<Mean<O>>,
                  std::enable_if_t<IsSampleable<C, O>::value && std::is_arithmetic_v<O>>> {
    static std::optional<Mean<O>> Aggregate(const Records<C>& records) {
        const auto samples = detail::CollectSamples<C, O>(records);
        if (samples.empty()) return std::nullopt;
        O sum{};
        for (const O& s : samples) sum += s;
        return Mean<O>{ static_cast<O>(sum / static_cast<O>(samples.size())) };
    }
};

template<typename C, typename O>
struct Aggregator<C, std::optional<Median<O>>, detail::EnableIfSampleable<C, O>> {
    static std::optional<Median<O>> Aggregate(const Records<C>& records) {
        const auto samples = detail::SortedSamples<C, O>(records);
        if (samples.empty()) return std::nullopt;
        return Median<O>{ samples[samples.size() / 2] };
    }
};

template<typename C, typename O, unsigned P>
struct Aggregator<C, std::optional<Percentile<O, P>>, detail::EnableIfSampleable<C, O>> {
    static std::optional<Percentile<O, P>> Aggregate(const Records<C>& records) {
        const auto samples = detail::SortedSamples<C, O>(records);
        if (samples.empty()) return std::nullopt;
        const size_t idx = std::min(samples.size() * P / 100, samples.size() - 1);
        return Percentile<O, P>{ samples[idx] };
    }
};

} // namespace Incerto::Sim
