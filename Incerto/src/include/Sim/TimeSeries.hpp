#pragma once

#include <ECS/System.hpp>
#include <Sim/Observe.hpp>
#include <Sim/StepCounter.hpp>

#include <cassert>
#include <memory>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Incerto::Sim {

// ---------------------------------------------------------------------------
// TimeSeries<O>: values sampled every SampleInterval() steps.
//
// Sample i was taken at the end of step StepAt(i). A series that starts with
// the simulation has its first sample at step SampleInterval(); a per-entity
// series for an entity spawned later starts at the first sampling step it was
// alive for.
// ---------------------------------------------------------------------------
template<typename O>
class TimeSeries {
public:
    explicit TimeSeries(size_t sampleInterval = 1, size_t firstStep = 0)
        : m_interval(sampleInterval)
        , m_first(firstStep != 0 ? firstStep : sampleInterval) {}

    void Push(O value) { m_values.push_back(std::move(value)); }
    void Clear() noexcept { m_values.clear(); }

    [[nodiscard]] size_t Size()  const noexcept { return m_values.size(); }
    [[nodiscard]] bool   Empty() const noexcept { return m_values.empty(); }

    [[nodiscard]] size_t SampleInterval() const noexcept { return m_interval; }

    // Number of steps the series spans.
    [[nodiscard]] size_t Duration() const noexcept { return m_values.size() * m_interval; }

    [[nodiscard]] size_t StepAt(size_t i) const noexcept { return m_first + i * m_interval; }

    [[nodiscard]] const std::vector<O>& Values() const noexcept { return m_values; }

    [[nodiscard]] const O& operator[](size_t i) const {
        assert(i < m_values.size() && "TimeSeries: sample index out of range");
        return m_values[i];
    }

    [[nodiscard]] auto begin() const noexcept { return m_values.begin(); }
    [[nodiscard]] auto end()   const noexcept { return m_values.end(); }

private:
    std::vector<O> m_values;
    size_t m_interval;
    size_t m_first;
};

// ---------------------------------------------------------------------------
// Recorder resources. One type per recorded series, so registering the same
// series twice is detectable by type.
// ---------------------------------------------------------------------------

// Aggregate of every C passing Fs, sampled with Aggregator<C, O>.
template<typename C, typename O, typename... Fs>
struct AggregateSeries {
    TimeSeries<O> series;
};

// One series per identifier value I, sampled with Sampler<C, O>.
template<typename C, typename I, typename O>
struct IdentifiedSeries {
    size_t interval = 1;
    std::unordered_map<I, TimeSeries<O>> series;
};

// PostUpdate system appending one aggregate sample on every interval-th step.
template<typename C, typename O, typename... Fs>
std::unique_ptr<ECS::System> MakeAggregateRecorder() {
    static_assert(IsAggregatable<C, O>::value,
                  "aggregate time series needs an Aggregator<C, O> specialization");
    return ECS::MakeSystem(std::string("record-aggregate:") + typeid(AggregateSeries<C, O, Fs...>).name(),
        [](ECS::Query<const C, Fs...> query,
           ECS::Res<StepCounter> counter,
           ECS::ResMut<AggregateSeries<C, O, Fs...>> out) {
            if (counter->step % out->series.SampleInterval() != 0) return;
            Records<C> records;
            query.Each([&records](ECS::EntityId, const C& c) { records.push_back(&c); });
            out->series.Push(Aggregator<C, O>::Aggregate(records));
        });
}

// PostUpdate system appending one sample per identified entity on every
// interval-th step.
template<typename C, typename I, typename O>
std::unique_ptr<ECS::System> MakeIdentifiedRecorder() {
    static_assert(IsSampleable<C, O>::value,
                  "per-entity time series needs a Sampler<C, O> specialization");
    return ECS::MakeSystem(std::string("record:") + typeid(IdentifiedSeries<C, I, O>).name(),
        [](ECS::Query<const C, const I> query,
           ECS::Res<StepCounter> counter,
           ECS::ResMut<IdentifiedSeries<C, I, O>> out) {
            const size_t step = counter->step;
            if (step % out->interval != 0) return;
            query.Each([&](ECS::EntityId, const C& c, const I& id) {
                auto it = out->series.find(id);
                if (it == out->series.end())
                    it = out->series.emplace(id, TimeSeries<O>(out->interval, step)).first;
                it->second.Push(Sampler<C, O>::Sample(c));
            });
        });
}

} // namespace Incerto::Sim
