#include <Config/ExperimentConfig.hpp>
#include <Sim/Errors.hpp>

#include <lua.hpp>
#include <raylib.h>

#include <cmath>
#include <limits>
#include <memory>

namespace Incerto::Config {

namespace {

using Sim::ConfigurationError;

struct LuaCloser {
    void operator()(lua_State* L) const noexcept { lua_close(L); }
};
using LuaStatePtr = std::unique_ptr<lua_State, LuaCloser>;

[[noreturn]] void fail(const std::string& what)
{
    throw ConfigurationError(ConfigurationError::Reason::InvalidConfigFile, what);
}

// Pops the error message left by a failed load / pcall.
[[noreturn]] void failWithLuaError(lua_State* L, const char* stage)
{
    const char* msg = lua_tostring(L, -1);
    std::string what = std::string("[config] ") + stage + ": " + (msg ? msg : "unknown error");
    lua_pop(L, 1);
    fail(what);
}

// experiment.<key> as a non-negative integer, or `fallback` when absent.
size_t readCount(lua_State* L, int table, const char* key, size_t fallback)
{
    lua_getfield(L, table, key);
    if (lua_isnil(L, -1)) { lua_pop(L, 1); return fallback; }

    if (lua_type(L, -1) != LUA_TNUMBER) {
        lua_pop(L, 1);
        fail(std::string("[config] experiment.") + key + " must be a number");
    }
    const double v = lua_tonumber(L, -1);
    lua_pop(L, 1);
    if (!std::isfinite(v) || v < 0.0 || std::floor(v) != v)
        fail(std::string("[config] experiment.") + key + " must be a non-negative integer");
    // size_t max is not exactly representable; its double rounds up to 2^N.
    if (v >= static_cast<double>(std::numeric_limits<size_t>::max()))
        fail(std::string("[config] experiment.") + key + " is too large");
    return static_cast<size_t>(v);
}

std::string readString(lua_State* L, int table, const char* key, const std::string& fallback)
{
    lua_getfield(L, table, key);
    if (lua_isnil(L, -1)) { lua_pop(L, 1); return fallback; }

    if (lua_type(L, -1) != LUA_TSTRING) {
        lua_pop(L, 1);
        fail(std::string("[config] experiment.") + key + " must be a string");
    }
    std::string v = lua_tostring(L, -1);
    lua_pop(L, 1);
    return v;
}

// Expects the chunk on top of the stack.
ExperimentConfig runAndRead(lua_State* L)
{
    if (lua_pcall(L, 0, 0, 0) != LUA_OK)
        failWithLuaError(L, "run");

    ExperimentConfig cfg;
    lua_getglobal(L, "experiment");
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        TraceLog(LOG_WARNING, "[config] no `experiment` table, using defaults");
        return cfg;
    }
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        fail("[config] `experiment` must be a table");
    }

    const int t = lua_gettop(L);
    cfg.steps    = readCount(L, t, "steps", cfg.steps);
    cfg.runs     = readCount(L, t, "runs", cfg.runs);
    cfg.workers  = readCount(L, t, "workers", cfg.workers);
    cfg.logLevel = readString(L, t, "logLevel", cfg.logLevel);
    lua_pop(L, 1);

    ParseLogLevel(cfg.logLevel);

    TraceLog(LOG_INFO, "[config] experiment: steps=%zu runs=%zu workers=%zu logLevel=%s",
             cfg.steps, cfg.runs, cfg.workers, cfg.logLevel.c_str());
    return cfg;
}

LuaStatePtr newState()
{
    LuaStatePtr L(luaL_newstate());
    if (!L) fail("[config] could not create a Lua state");
    luaL_openlibs(L.get());
    return L;
}

} // anonymous namespace

ExperimentConfig LoadExperimentConfig(const std::string& path)
{
    auto L = newState();
    if (luaL_loadfile(L.get(), path.c_str()) != LUA_OK)
        failWithLuaError(L.get(), "load");
    return runAndRead(L.get());
}

ExperimentConfig LoadExperimentConfigFromString(const std::string& source, const std::string& chunkName)
{
    auto L = newState();
    if (luaL_loadbuffer(L.get(), source.data(), source.size(), chunkName.c_str()) != LUA_OK)
        failWithLuaError(L.get(), "load");
    return runAndRead(L.get());
}

int ParseLogLevel(const std::string& name)
{
    if (name == "all")     return LOG_ALL;
    if (name == "trace")   return LOG_TRACE;
    if (name == "debug")   return LOG_DEBUG;
    if (name == "info")    return LOG_INFO;
    if (name == "warning") return LOG_WARNING;
    if (name == "error")   return LOG_ERROR;
    if (name == "fatal")   return LOG_FATAL;
    if (name == "none")    return LOG_NONE;
    fail("[config] unknown log level '" + name + "'");
}

void ApplyLogLevel(const ExperimentConfig& config)
{
    SetTraceLogLevel(ParseLogLevel(config.logLevel));
}

} // namespace Incerto::Config
