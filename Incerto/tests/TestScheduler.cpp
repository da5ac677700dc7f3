#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include <ECS/ECS.hpp>

#include "TestSupport.hpp"

using namespace Incerto::ECS;

namespace {

struct Position { int x = 0; };
struct Velocity { int dx = 1; };
struct Health   { int hp = 10; };
struct Tick     { long count = 0; };

// Hand-written system with an explicit access declaration.
class DecayHealth final : public System {
public:
    DecayHealth() : System("decay-health") {}

    void Update(Registry& reg, Commands&) override {
        reg.View<Health>([](EntityId, Health& h) { --h.hp; });
    }

    Access GetAccess() const override {
        Access access;
        access.Writes<Health>();
        return access;
    }
};

} // namespace

static void runBatchingFollowsAccess() {
    Scheduler sched(4);
    sched.AddSystem(MakeSystem("move", [](Query<Position, const Velocity>) {}));
    sched.AddSystem(std::make_unique<DecayHealth>());
    sched.AddSystem(MakeSystem("read-pos", [](Query<const Position>) {}));
    sched.AddSystem(MakeSystem("read-pos-2", [](Query<const Position>) {}));
    sched.AddSystem(MakeSystem("everything", [](Registry&) {}));
    sched.AddSystem(MakeSystem("tick", [](ResMut<Tick>) {}));

    const auto batches = sched.Batches(Stage::Update);
    REQUIRE(batches.size() == 4, "expected 4 batches, got " << batches.size());
    REQUIRE(batches[0].size() == 2, "move and decay-health share the first batch");
    REQUIRE(batches[0][0] == "move" && batches[0][1] == "decay-health", "batch 0 order");
    REQUIRE(batches[1].size() == 2, "both position readers share the second batch");
    REQUIRE(batches[2].size() == 1 && batches[2][0] == "everything", "exclusive system runs alone");
    REQUIRE(batches[3].size() == 1 && batches[3][0] == "tick", "systems after an exclusive one wait for it");
    REQUIRE(sched.SystemCount() == 6 && sched.SystemCount(Stage::Update) == 6, "system counts");
    REQUIRE(sched.Find("tick") != nullptr && sched.Find("nope") == nullptr, "Find by name");

    pass("Scheduler batches by declared access");
}

static void runAccessDeclaration() {
    Access rw;
    rw.Reads<Position>().Writes<Position>();
    REQUIRE(rw.reads.empty() && rw.writes.size() == 1, "write subsumes read");

    Access r1, r2, w;
    r1.Reads<Position>();
    r2.Reads<Position>();
    w.Writes<Position>();
    REQUIRE(!r1.ConflictsWith(r2), "readers do not conflict");
    REQUIRE(r1.ConflictsWith(w) && w.ConflictsWith(r1), "reader and writer conflict");

    const auto filtered = MakeSystem("filtered", [](Query<const Position, With<Health>, Without<Velocity>>) {});
    const Access a = filtered->GetAccess();
    REQUIRE(a.reads.size() == 1 && a.writes.empty() && !a.exclusive, "filters declare no access");

    pass("Access declaration + conflicts");
}

static void runParallelStepIsCorrect() {
    Registry reg;
    reg.InsertResource(Tick{});
    for (int i = 0; i < 1000; ++i) reg.Spawn(Position{0}, Velocity{1}, Health{100});

    Scheduler sched(4);
    sched.AddSystem(MakeSystem("move", [](Query<Position, const Velocity> q) {
        q.Each([](EntityId, Position& p, const Velocity& v) { p.x += v.dx; });
    }));
    sched.AddSystem(std::make_unique<DecayHealth>());
    sched.AddSystem(MakeSystem("tick", [](ResMut<Tick> t) { ++t->count; }));

    for (int s = 0; s < 25; ++s) sched.RunStep(reg);

    bool ok = true;
    reg.View<const Position, const Health>([&ok](EntityId, const Position& p, const Health& h) {
        ok = ok && p.x == 25 && h.hp == 75;
    });
    REQUIRE(ok, "every entity advanced exactly 25 times");
    REQUIRE(reg.GetResource<Tick>().count == 25, "resource system ran once per step");

    pass("Scheduler parallel step");
}

static void runStagesAndCommands() {
    Registry reg;
    std::vector<std::string> order;

    Scheduler sched(1);
    sched.AddSystem(MakeSystem("post", [&order](Query<const Position>) { order.push_back("post"); }),
                    Stage::PostUpdate);
    sched.AddSystem(MakeSystem("update", [&order](Query<const Position> q, Commands& cmd) {
        order.push_back("update");
        if (q.Count() < 3) cmd.Spawn(Position{7});
    }));
    sched.AddSystem(MakeSystem("pre", [&order](Query<const Position>) { order.push_back("pre"); }),
                    Stage::PreUpdate);

    reg.Spawn(Position{0});
    sched.RunStep(reg);
    REQUIRE(order.size() == 3 && order[0] == "pre" && order[1] == "update" && order[2] == "post",
            "stages run in order");
    REQUIRE(reg.Count<Position>() == 2, "spawn command applied after its stage");

    sched.RunStep(reg);
    sched.RunStep(reg);
    REQUIRE(reg.Count<Position>() == 3, "spawning stops once the query sees three");

    pass("Scheduler stages + commands");
}

static void runFailurePropagates() {
    Registry reg;
    reg.Spawn(Position{0}, Velocity{1});

    std::atomic<int> siblingRuns{0};
    Scheduler sched(2);
    sched.AddSystem(MakeSystem("boom", [](Query<const Position>, Commands& cmd) {
        cmd.Spawn(Position{1});
        throw std::runtime_error("boom");
    }));
    sched.AddSystem(MakeSystem("sibling", [&siblingRuns](Query<const Velocity>) { ++siblingRuns; }));
    sched.AddSystem(MakeSystem("later", [](Query<Position>) {}), Stage::PostUpdate);

    REQUIRE_THROWS(sched.RunStep(reg), std::runtime_error, "system exception reaches the caller");
    REQUIRE(siblingRuns == 1, "rest of the batch still completed");
    REQUIRE(reg.Count<Position>() == 1, "commands of the failed stage were discarded");

    sched.Find("boom")->SetEnabled(false);
    sched.RunStep(reg);
    REQUIRE(siblingRuns == 2, "disabled system skipped, step succeeds");

    pass("Scheduler failure propagation");
}

static void runMissingResourceThrows() {
    Registry reg;
    Scheduler sched(1);
    sched.AddSystem(MakeSystem("needs-tick", [](Res<Tick>) {}));
    REQUIRE_THROWS(sched.RunStep(reg), std::runtime_error, "missing resource is reported");
    pass("Scheduler missing resource");
}

int main() {
    runBatchingFollowsAccess();
    runAccessDeclaration();
    runParallelStepIsCorrect();
    runStagesAndCommands();
    runFailurePropagates();
    runMissingResourceThrows();
    return 0;
}
