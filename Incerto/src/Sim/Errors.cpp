#include <Sim/Errors.hpp>

namespace Incerto::Sim {

const char* ToString(ConfigurationError::Reason reason) noexcept
{
    switch (reason) {
        case ConfigurationError::Reason::EmptyRecipe:                 return "EmptyRecipe";
        case ConfigurationError::Reason::TimeSeriesRecordingConflict: return "TimeSeriesRecordingConflict";
        case ConfigurationError::Reason::InvalidSampleInterval:       return "InvalidSampleInterval";
        case ConfigurationError::Reason::InvalidConfigFile:           return "InvalidConfigFile";
    }
    return "?";
}

const char* ToString(ObservationError::Kind kind) noexcept
{
    switch (kind) {
        case ObservationError::Kind::NotFound:  return "NotFound";
        case ObservationError::Kind::Ambiguous: return "Ambiguous";
    }
    return "?";
}

} // namespace Incerto::Sim
