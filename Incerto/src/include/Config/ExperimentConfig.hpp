#pragma once

#include <cstddef>
#include <string>

namespace Incerto::Config {

// Parameters of one experiment, read from a Lua file:
//
//   experiment = {
//       steps    = 500,     -- steps per run
//       runs     = 20,      -- independent runs (RunNew each)
//       workers  = 4,       -- scheduler threads, 0 = hardware concurrency
//       logLevel = "info",  -- all | trace | debug | info | warning | error | fatal | none
//   }
//
// Missing keys keep the defaults below; a missing table yields all defaults.
struct ExperimentConfig {
    size_t      steps    = 100;
    size_t      runs     = 1;
    size_t      workers  = 0;
    std::string logLevel = "info";
};

// Throws Sim::ConfigurationError (InvalidConfigFile) if the file cannot be
// loaded or run, or if a key has the wrong type.
[[nodiscard]] ExperimentConfig LoadExperimentConfig(const std::string& path);

// Same, from Lua source held in memory. chunkName shows up in error messages.
[[nodiscard]] ExperimentConfig LoadExperimentConfigFromString(const std::string& source,
                                                              const std::string& chunkName = "=experiment");

// raylib TraceLogLevel for a level name; throws Sim::ConfigurationError
// (InvalidConfigFile) for an unknown name.
[[nodiscard]] int ParseLogLevel(const std::string& name);

// SetTraceLogLevel(ParseLogLevel(config.logLevel)).
void ApplyLogLevel(const ExperimentConfig& config);

} // namespace Incerto::Config
