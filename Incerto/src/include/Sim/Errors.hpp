#pragma once

#include <stdexcept>
#include <string>

namespace Incerto::Sim {

// Raised while assembling an experiment; the builder (or config file) can be
// corrected and the call retried.
class ConfigurationError : public std::runtime_error {
public:
    enum class Reason {
        EmptyRecipe,                 // no spawners and no systems
        TimeSeriesRecordingConflict, // same series registered twice
        InvalidSampleInterval,       // sample interval of 0
        InvalidConfigFile,           // experiment file unreadable or mistyped
    };

    ConfigurationError(Reason reason, const std::string& what)
        : std::runtime_error(what), m_reason(reason) {}

    [[nodiscard]] Reason reason() const noexcept { return m_reason; }

private:
    Reason m_reason;
};

// Raised by the read-out operations of a Simulation.
class ObservationError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,  // no entity carries the requested record
        Ambiguous, // a unique entity was requested but several match
    };

    ObservationError(Kind kind, const std::string& what)
        : std::runtime_error(what), m_kind(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

private:
    Kind m_kind;
};

[[nodiscard]] const char* ToString(ConfigurationError::Reason reason) noexcept;
[[nodiscard]] const char* ToString(ObservationError::Kind kind) noexcept;

} // namespace Incerto::Sim
