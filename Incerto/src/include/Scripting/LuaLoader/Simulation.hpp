#pragma once

#include <functional>
#include <string>

struct lua_State;

namespace Incerto::Sim { class Simulation; }

namespace Incerto::Scripting::LuaLoader {

// A named read-out exposed to scripts as sim.observe(name).
using Observable = std::function<double(const Sim::Simulation&)>;

// ── Lifetime setters ─────────────────────────────────────────────────────────
// Safe to call before or after registerSimulation().

/// Set the Simulation the `sim.*` Lua functions drive.
/// Pass nullptr to detach (calls then log a warning and do nothing).
void setSimulation(Sim::Simulation* sim);

/// Add or replace a named observable.
void registerObservable(const std::string& name, Observable fn);

/// Forget every named observable.
void clearObservables();

// ── Registration ─────────────────────────────────────────────────────────────
/// Register the `sim` global table into the given Lua state.
///
/// Lifecycle
/// ---------
///   sim.run(n)                      -- advance n steps
///   sim.reset()                     -- fresh population, step count 0
///   sim.runNew(n)                   -- reset() then run(n)
///   sim.stepCount()                 → integer
///   sim.entityCount()               → integer
///
/// Observation
/// -----------
///   sim.observe(name)               → number  -- raises a Lua error if the
///                                               observable is unknown or fails
///   sim.observables()               → { name, ... }  (sorted)
///
/// Errors thrown by the simulation (a failing step, an observation error)
/// surface as Lua errors carrying the exception message.
void registerSimulation(lua_State* L);

} // namespace Incerto::Scripting::LuaLoader
