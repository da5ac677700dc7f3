#pragma once

#include <cstdint>

namespace Incerto::ECS {

// ---------------------------------------------------------------------------
// EntityId: a 32-bit handle that packs a slot index and a generation.
//
//   bits  0-19  (20 bits)  →  slot index   (up to 1,048,576 live entities)
//   bits 20-31  (12 bits)  →  generation   (wraps at 4,096 recycles/slot)
//
// A population built by a spawner starts at generation 0 in every slot.
// Registry::Clear() forgets all generations, so ids handed out before a
// reset must not be kept across it.
// ---------------------------------------------------------------------------

using EntityId = uint32_t;

inline constexpr uint32_t INDEX_BITS = 20u;
inline constexpr uint32_t GEN_BITS   = 12u;
inline constexpr uint32_t INDEX_MASK = (1u << INDEX_BITS) - 1u;
inline constexpr uint32_t GEN_MASK   = (1u << GEN_BITS) - 1u;

// Largest number of simultaneously live entities a Registry can hold.
inline constexpr uint32_t MAX_ENTITIES = INDEX_MASK;

[[nodiscard]] inline constexpr uint32_t EntityIndex(EntityId id) noexcept {
    return id & INDEX_MASK;
}

[[nodiscard]] inline constexpr uint32_t EntityGeneration(EntityId id) noexcept {
    return (id >> INDEX_BITS) & GEN_MASK;
}

[[nodiscard]] inline constexpr EntityId MakeEntity(uint32_t idx, uint32_t gen) noexcept {
    return ((gen & GEN_MASK) << INDEX_BITS) | (idx & INDEX_MASK);
}

} // namespace Incerto::ECS
