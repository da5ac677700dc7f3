#include <ECS/Scheduler.hpp>

#include <raylib.h>

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace Incerto::ECS {

const char* StageName(Stage stage) noexcept
{
    switch (stage) {
        case Stage::PreUpdate:  return "PreUpdate";
        case Stage::Update:     return "Update";
        case Stage::PostUpdate: return "PostUpdate";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// WorkerPool: persistent helper threads that drain one batch of tasks at a
// time. The thread calling RunAll works on the batch too, so a pool with
// zero helpers runs everything inline. Tasks must not throw.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(size_t helpers)
    {
        m_threads.reserve(helpers);
        for (size_t i = 0; i < helpers; ++i)
            m_threads.emplace_back([this] { WorkerLoop(); });
    }

    ~WorkerPool()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wake.notify_all();
        for (auto& t : m_threads) t.join();
    }

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Blocks until every task of the batch has returned.
    void RunAll(const std::vector<std::function<void()>>& tasks)
    {
        if (tasks.empty()) return;
        std::unique_lock<std::mutex> lock(m_mutex);
        m_tasks   = &tasks;
        m_next    = 0;
        m_pending = tasks.size();
        ++m_generation;
        m_wake.notify_all();

        Drain(lock);
        m_done.wait(lock, [this] { return m_pending == 0; });
        m_tasks = nullptr;
    }

private:
    void WorkerLoop()
    {
        uint64_t seen = 0;
        std::unique_lock<std::mutex> lock(m_mutex);
        for (;;) {
            m_wake.wait(lock, [&] { return m_stopping || m_generation != seen; });
            if (m_stopping) return;
            seen = m_generation;
            Drain(lock);
        }
    }

    // Called with the lock held; releases it around each task.
    void Drain(std::unique_lock<std::mutex>& lock)
    {
        while (m_tasks && m_next < m_tasks->size()) {
            const auto* tasks = m_tasks;
            const size_t i    = m_next++;
            lock.unlock();
            (*tasks)[i]();
            lock.lock();
            if (--m_pending == 0) m_done.notify_all();
        }
    }

    std::vector<std::thread> m_threads;
    std::mutex               m_mutex;
    std::condition_variable  m_wake;
    std::condition_variable  m_done;

    const std::vector<std::function<void()>>* m_tasks = nullptr;
    size_t   m_next       = 0;
    size_t   m_pending    = 0;
    uint64_t m_generation = 0;
    bool     m_stopping   = false;
};

// ---------------------------------------------------------------------------

Scheduler::Scheduler(size_t workerThreads)
{
    m_workers = workerThreads;
    if (m_workers == 0) {
        const unsigned hw = std::thread::hardware_concurrency();
        m_workers = hw > 0 ? hw : 1;
    }
    m_pool = std::make_unique<WorkerPool>(m_workers - 1);
}

Scheduler::~Scheduler() = default;

Scheduler::Scheduler(Scheduler&&) noexcept            = default;
Scheduler& Scheduler::operator=(Scheduler&&) noexcept = default;

void Scheduler::AddSystem(std::unique_ptr<System> system, Stage stage)
{
    if (!system) return;

    auto& sched = m_stages[static_cast<size_t>(stage)];
    Entry entry;
    entry.access = system->GetAccess();
    entry.system = std::move(system);

    // First batch after the last one holding a conflicting system.
    size_t target = 0;
    for (size_t b = 0; b < sched.batches.size(); ++b) {
        for (const size_t other : sched.batches[b]) {
            if (entry.access.ConflictsWith(sched.entries[other].access)) {
                target = b + 1;
                break;
            }
        }
    }
    if (target == sched.batches.size()) sched.batches.emplace_back();

    TraceLog(LOG_DEBUG, "[ecs] %s: system '%s' -> batch %zu",
             StageName(stage), entry.system->Name().c_str(), target);

    sched.batches[target].push_back(sched.entries.size());
    sched.entries.push_back(std::move(entry));
}

void Scheduler::RunStep(Registry& reg)
{
    for (auto& stage : m_stages)
        RunStage(stage, reg);
}

void Scheduler::RunStage(StageSchedule& stage, Registry& reg)
{
    // A throwing system or command abandons every buffer of the stage.
    try {
        for (const auto& batch : stage.batches)
            RunBatch(stage, batch, reg);
        for (auto& e : stage.entries)
            e.commands.Apply(reg);
    } catch (...) {
        for (auto& e : stage.entries) e.commands.Clear();
        throw;
    }
}

void Scheduler::DiscardPending() noexcept
{
    for (auto& stage : m_stages)
        for (auto& e : stage.entries) e.commands.Clear();
}

void Scheduler::RunBatch(StageSchedule& stage, const std::vector<size_t>& batch, Registry& reg)
{
    if (batch.size() == 1) {
        Entry& e = stage.entries[batch.front()];
        if (e.system->IsEnabled()) e.system->Update(reg, e.commands);
        return;
    }

    std::vector<std::exception_ptr>    errors(batch.size());
    std::vector<std::function<void()>> tasks;
    tasks.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        Entry& e = stage.entries[batch[i]];
        if (!e.system->IsEnabled()) continue;
        tasks.emplace_back([&e, &reg, &err = errors[i]] {
            try {
                e.system->Update(reg, e.commands);
            } catch (...) {
                err = std::current_exception();
            }
        });
    }

    m_pool->RunAll(tasks);

    for (const auto& err : errors)
        if (err) std::rethrow_exception(err);
}

size_t Scheduler::SystemCount() const noexcept
{
    size_t n = 0;
    for (const auto& stage : m_stages) n += stage.entries.size();
    return n;
}

size_t Scheduler::SystemCount(Stage stage) const noexcept
{
    return m_stages[static_cast<size_t>(stage)].entries.size();
}

std::vector<std::vector<std::string>> Scheduler::Batches(Stage stage) const
{
    const auto& sched = m_stages[static_cast<size_t>(stage)];
    std::vector<std::vector<std::string>> names;
    names.reserve(sched.batches.size());
    for (const auto& batch : sched.batches) {
        auto& out = names.emplace_back();
        for (const size_t i : batch) out.push_back(sched.entries[i].system->Name());
    }
    return names;
}

System* Scheduler::Find(const std::string& name) const
{
    for (const auto& stage : m_stages)
        for (const auto& e : stage.entries)
            if (e.system->Name() == name) return e.system.get();
    return nullptr;
}

} // namespace Incerto::ECS
