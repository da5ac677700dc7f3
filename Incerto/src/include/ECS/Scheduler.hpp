#pragma once

#include <ECS/Commands.hpp>
#include <ECS/Registry.hpp>
#include <ECS/System.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Incerto::ECS {

// Stages of one step, run in this order. Harness bookkeeping (grid
// indexing, time-series sampling) lives in PreUpdate / PostUpdate so user
// systems in Update always see a consistent picture.
enum class Stage : uint8_t {
    PreUpdate,
    Update,
    PostUpdate,
};

inline constexpr size_t STAGE_COUNT = 3;

[[nodiscard]] const char* StageName(Stage stage) noexcept;

class WorkerPool;

// ---------------------------------------------------------------------------
// Scheduler: owns the registered systems and advances a Registry by one
// step at a time.
//
// Within each stage, systems are packed into batches: a system goes into the
// first batch after the last one holding a system it conflicts with (see
// Access::ConflictsWith). Conflicting systems therefore run in registration
// order; systems with disjoint access may share a batch and run on the
// worker pool at the same time. Every batch is a barrier.
//
// After a stage completes, each system's Commands buffer is applied in
// registration order.
//
// If a system throws, the rest of its batch still finishes, the first
// exception (in registration order) is rethrown, and nothing further of
// that step runs. Pending commands of the failed stage are discarded, also
// when one of the commands itself throws while being applied.
// ---------------------------------------------------------------------------
class Scheduler {
public:
    // workerThreads == 0 uses the hardware concurrency; 1 runs everything
    // on the calling thread.
    explicit Scheduler(size_t workerThreads = 0);
    ~Scheduler();

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) noexcept;
    Scheduler& operator=(Scheduler&&) noexcept;

    void AddSystem(std::unique_ptr<System> system, Stage stage = Stage::Update);

    // Run every enabled system of every stage exactly once.
    void RunStep(Registry& reg);

    // Drop every queued command. Buffers refer to entity ids, which a
    // Registry::Clear() hands out again.
    void DiscardPending() noexcept;

    [[nodiscard]] size_t SystemCount() const noexcept;
    [[nodiscard]] size_t SystemCount(Stage stage) const noexcept;
    [[nodiscard]] size_t WorkerCount() const noexcept { return m_workers; }

    // System names per batch, in execution order.
    [[nodiscard]] std::vector<std::vector<std::string>> Batches(Stage stage) const;

    // Registered system by name, or nullptr.
    [[nodiscard]] System* Find(const std::string& name) const;

private:
    struct Entry {
        std::unique_ptr<System> system;
        Access   access;
        Commands commands;
    };

    struct StageSchedule {
        std::vector<Entry> entries;
        std::vector<std::vector<size_t>> batches;
    };

    void RunStage(StageSchedule& stage, Registry& reg);
    void RunBatch(StageSchedule& stage, const std::vector<size_t>& batch, Registry& reg);

    std::array<StageSchedule, STAGE_COUNT> m_stages;
    size_t m_workers = 1;
    std::unique_ptr<WorkerPool> m_pool;
};

} // namespace Incerto::ECS
