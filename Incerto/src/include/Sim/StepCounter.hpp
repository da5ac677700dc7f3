#pragma once

#include <cstddef>

namespace Incerto::Sim {

// Resource present in every simulation. While a step runs, `step` holds its
// 1-based number; between steps it equals the number of steps completed.
struct StepCounter {
    size_t step = 0;
};

} // namespace Incerto::Sim
