#include <lua.hpp>
#include <raylib.h>
#include <Sim/Simulation.hpp>
#include <Scripting/LuaLoader/Simulation.hpp>

#include <exception>
#include <map>
#include <string>

// ── Module-level state ────────────────────────────────────────────────────────
// Set by the host before running scripts. All Lua bindings below check for
// nullptr.

namespace Incerto::Scripting::LuaLoader {

namespace {
    static Sim::Simulation*                   g_sim = nullptr;
    static std::map<std::string, Observable>  g_observables;
} // anonymous namespace

void setSimulation(Sim::Simulation* sim) { g_sim = sim; }

void registerObservable(const std::string& name, Observable fn)
{
    g_observables[name] = std::move(fn);
}

void clearObservables() { g_observables.clear(); }

// ── Helpers ───────────────────────────────────────────────────────────────────

static inline bool simulationReady()
{
    if (g_sim) return true;
    TraceLog(LOG_WARNING, "[lua] Simulation not set, call ignored");
    return false;
}

static inline size_t toSteps(lua_State* L, int idx)
{
    const lua_Integer n = luaL_checkinteger(L, idx);
    luaL_argcheck(L, n >= 0, idx, "step count must be non-negative");
    return static_cast<size_t>(n);
}

// Runs fn and turns a C++ exception into a Lua error. The message is copied
// onto the Lua stack before the exception object goes away, so lua_error
// never unwinds past a live C++ object.
template<typename Fn>
static int guarded(lua_State* L, Fn&& fn)
{
    try {
        return fn();
    } catch (const std::exception& e) {
        lua_pushstring(L, e.what());
    }
    return lua_error(L);
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

// sim.run(n)
static int l_run(lua_State* L)
{
    const size_t n = toSteps(L, 1);
    if (!simulationReady()) return 0;
    return guarded(L, [n] { g_sim->Run(n); return 0; });
}

// sim.reset()
static int l_reset(lua_State* L)
{
    if (!simulationReady()) return 0;
    return guarded(L, [] { g_sim->Reset(); return 0; });
}

// sim.runNew(n)
static int l_runNew(lua_State* L)
{
    const size_t n = toSteps(L, 1);
    if (!simulationReady()) return 0;
    return guarded(L, [n] { g_sim->RunNew(n); return 0; });
}

// sim.stepCount() → integer
static int l_stepCount(lua_State* L)
{
    lua_pushinteger(L, g_sim ? static_cast<lua_Integer>(g_sim->StepCount()) : 0);
    return 1;
}

// sim.entityCount() → integer
static int l_entityCount(lua_State* L)
{
    lua_pushinteger(L, g_sim ? static_cast<lua_Integer>(g_sim->EntityCount()) : 0);
    return 1;
}

// ── Observation ───────────────────────────────────────────────────────────────

static const Observable* findObservable(const char* name)
{
    const auto it = g_observables.find(name);
    return it != g_observables.end() ? &it->second : nullptr;
}

// sim.observe(name) → number
static int l_observe(lua_State* L)
{
    const char* name = luaL_checkstring(L, 1);
    if (!simulationReady()) { lua_pushnil(L); return 1; }

    const Observable* fn = findObservable(name);
    if (!fn) return luaL_error(L, "unknown observable '%s'", name);

    return guarded(L, [L, fn] {
        lua_pushnumber(L, (*fn)(*g_sim));
        return 1;
    });
}

// sim.observables() → { name, ... }
static int l_observables(lua_State* L)
{
    lua_createtable(L, static_cast<int>(g_observables.size()), 0);
    lua_Integer i = 1;
    for (const auto& entry : g_observables) {
        lua_pushstring(L, entry.first.c_str());
        lua_rawseti(L, -2, i++);
    }
    return 1;
}

// ── Registration ─────────────────────────────────────────────────────────────

void registerSimulation(lua_State* L)
{
    static const luaL_Reg funcs[] = {
        // Lifecycle
        {"run",             l_run},
        {"reset",           l_reset},
        {"runNew",          l_runNew},
        {"stepCount",       l_stepCount},
        {"entityCount",     l_entityCount},
        // Observation
        {"observe",         l_observe},
        {"observables",     l_observables},
        {nullptr, nullptr}
    };

    luaL_newlib(L, funcs);
    lua_setglobal(L, "sim");
}

} // namespace Incerto::Scripting::LuaLoader
