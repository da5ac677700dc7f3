#pragma once

#include <ECS/System.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace Incerto::Sim {

// ---------------------------------------------------------------------------
// Integer grid coordinates
// ---------------------------------------------------------------------------

struct GridCoord2 {
    int x = 0;
    int y = 0;

    bool operator==(const GridCoord2& o) const noexcept { return x == o.x && y == o.y; }
    bool operator!=(const GridCoord2& o) const noexcept { return !(*this == o); }
    GridCoord2 operator+(const GridCoord2& o) const noexcept { return { x + o.x, y + o.y }; }
};

struct GridCoord3 {
    int x = 0;
    int y = 0;
    int z = 0;

    bool operator==(const GridCoord3& o) const noexcept { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const GridCoord3& o) const noexcept { return !(*this == o); }
    GridCoord3 operator+(const GridCoord3& o) const noexcept { return { x + o.x, y + o.y, z + o.z }; }
};

// Moore neighbourhood: 8 cells in 2D, 26 in 3D.
std::vector<GridCoord2> Neighbors(GridCoord2 c);
std::vector<GridCoord3> Neighbors(GridCoord3 c);

// Von Neumann neighbourhood: 4 cells in 2D, 6 in 3D.
std::vector<GridCoord2> OrthogonalNeighbors(GridCoord2 c);
std::vector<GridCoord3> OrthogonalNeighbors(GridCoord3 c);

uint32_t ManhattanDistance(GridCoord2 a, GridCoord2 b) noexcept;
uint32_t ManhattanDistance(GridCoord3 a, GridCoord3 b) noexcept;

// Every coordinate whose Manhattan distance to c is at most distance
// (c itself included).
std::vector<GridCoord2> CoordinatesWithinDistance(GridCoord2 c, uint32_t distance);
std::vector<GridCoord3> CoordinatesWithinDistance(GridCoord3 c, uint32_t distance);

// Inclusive box test.
bool WithinBounds(GridCoord2 c, GridCoord2 min, GridCoord2 max) noexcept;
bool WithinBounds(GridCoord3 c, GridCoord3 min, GridCoord3 max) noexcept;

} // namespace Incerto::Sim

namespace std {

template<>
struct hash<Incerto::Sim::GridCoord2> {
    size_t operator()(const Incerto::Sim::GridCoord2& c) const noexcept {
        const uint64_t k = (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32)
                         |  static_cast<uint64_t>(static_cast<uint32_t>(c.y));
        return std::hash<uint64_t>{}(k);
    }
};

template<>
struct hash<Incerto::Sim::GridCoord3> {
    size_t operator()(const Incerto::Sim::GridCoord3& c) const noexcept {
        size_t h = std::hash<int>{}(c.x);
        h ^= std::hash<int>{}(c.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<int>{}(c.z) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std

namespace Incerto::Sim {

// ---------------------------------------------------------------------------
// GridPosition<Coord>: record placing an entity on a grid cell.
// ---------------------------------------------------------------------------
template<typename Coord>
struct GridPosition {
    Coord value;

    [[nodiscard]] std::vector<GridPosition> Neighbors() const {
        return Wrap(Sim::Neighbors(value));
    }
    [[nodiscard]] std::vector<GridPosition> OrthogonalNeighbors() const {
        return Wrap(Sim::OrthogonalNeighbors(value));
    }
    [[nodiscard]] uint32_t ManhattanDistance(const GridPosition& other) const noexcept {
        return Sim::ManhattanDistance(value, other.value);
    }

    bool operator==(const GridPosition& o) const noexcept { return value == o.value; }
    bool operator!=(const GridPosition& o) const noexcept { return value != o.value; }

private:
    static std::vector<GridPosition> Wrap(const std::vector<Coord>& coords) {
        std::vector<GridPosition> out;
        out.reserve(coords.size());
        for (const Coord& c : coords) out.push_back(GridPosition{ c });
        return out;
    }
};

using GridPosition2D = GridPosition<GridCoord2>;
using GridPosition3D = GridPosition<GridCoord3>;

// ---------------------------------------------------------------------------
// GridBounds<Coord>: inclusive box of valid cells.
// ---------------------------------------------------------------------------
template<typename Coord>
struct GridBounds {
    Coord min;
    Coord max;

    [[nodiscard]] bool Contains(const Coord& c) const noexcept { return WithinBounds(c, min, max); }
    [[nodiscard]] bool Contains(const GridPosition<Coord>& p) const noexcept { return Contains(p.value); }

    [[nodiscard]] uint32_t Width()  const noexcept { return static_cast<uint32_t>(max.x - min.x + 1); }
    [[nodiscard]] uint32_t Height() const noexcept { return static_cast<uint32_t>(max.y - min.y + 1); }
    [[nodiscard]] uint32_t Depth()  const noexcept {
        if constexpr (std::is_same_v<Coord, GridCoord3>)
            return static_cast<uint32_t>(max.z - min.z + 1);
        else
            return 1;
    }
    [[nodiscard]] uint32_t TotalCells() const noexcept { return Width() * Height() * Depth(); }

    bool operator==(const GridBounds& o) const noexcept { return min == o.min && max == o.max; }
};

// ---------------------------------------------------------------------------
// SpatialGrid<Coord, C>: cell index over every entity owning both a
// GridPosition<Coord> and a C. Kept as a simulation resource and rebuilt at
// the start of each step, so systems read the positions as they were when
// the step began.
//
// Several grids may coexist as long as their (Coord, C) pairs differ.
// ---------------------------------------------------------------------------
template<typename Coord, typename C>
class SpatialGrid {
public:
    using Position = GridPosition<Coord>;

    explicit SpatialGrid(std::optional<GridBounds<Coord>> bounds = std::nullopt)
        : m_bounds(bounds) {}

    [[nodiscard]] const std::optional<GridBounds<Coord>>& Bounds() const noexcept { return m_bounds; }

    // Index (or move) an entity. Throws std::out_of_range if the position
    // lies outside the configured bounds.
    void Insert(ECS::EntityId entity, const Position& position) {
        if (m_bounds && !m_bounds->Contains(position))
            throw std::out_of_range("SpatialGrid: entity position lies outside the grid bounds");
        Remove(entity);
        m_cells[position.value].push_back(entity);
        m_positions.emplace(entity, position.value);
    }

    // Returns where the entity was, if it was indexed.
    std::optional<Position> Remove(ECS::EntityId entity) {
        const auto it = m_positions.find(entity);
        if (it == m_positions.end()) return std::nullopt;

        const Coord where = it->second;
        m_positions.erase(it);
        auto cell = m_cells.find(where);
        if (cell != m_cells.end()) {
            auto& ids = cell->second;
            ids.erase(std::remove(ids.begin(), ids.end(), entity), ids.end());
            if (ids.empty()) m_cells.erase(cell);
        }
        return Position{ where };
    }

    void Clear() noexcept {
        m_cells.clear();
        m_positions.clear();
    }

    [[nodiscard]] std::vector<ECS::EntityId> EntitiesAt(const Position& position) const {
        const auto it = m_cells.find(position.value);
        return it != m_cells.end() ? it->second : std::vector<ECS::EntityId>{};
    }

    [[nodiscard]] std::optional<Position> PositionOf(ECS::EntityId entity) const {
        const auto it = m_positions.find(entity);
        if (it == m_positions.end()) return std::nullopt;
        return Position{ it->second };
    }

    // Entities on the Moore neighbourhood of position (the cell itself is
    // excluded). Neighbour cells outside the bounds are skipped.
    [[nodiscard]] std::vector<ECS::EntityId> NeighborsOf(const Position& position) const {
        return Gather(Sim::Neighbors(position.value));
    }

    // Entities on the Von Neumann neighbourhood of position.
    [[nodiscard]] std::vector<ECS::EntityId> OrthogonalNeighborsOf(const Position& position) const {
        return Gather(Sim::OrthogonalNeighbors(position.value));
    }

    [[nodiscard]] bool IsEmpty(const Position& position) const {
        return m_cells.find(position.value) == m_cells.end();
    }

    [[nodiscard]] size_t NumEntities() const noexcept { return m_positions.size(); }

private:
    std::vector<ECS::EntityId> Gather(const std::vector<Coord>& cells) const {
        std::vector<ECS::EntityId> out;
        for (const Coord& c : cells) {
            if (m_bounds && !m_bounds->Contains(c)) continue;
            const auto it = m_cells.find(c);
            if (it != m_cells.end())
                out.insert(out.end(), it->second.begin(), it->second.end());
        }
        return out;
    }

    std::optional<GridBounds<Coord>> m_bounds;
    std::unordered_map<Coord, std::vector<ECS::EntityId>> m_cells;
    std::unordered_map<ECS::EntityId, Coord>              m_positions;
};

// Re-index every positioned C into the grid resource.
template<typename Coord, typename C>
void RebuildSpatialGrid(ECS::Registry& reg) {
    auto& grid = reg.GetResource<SpatialGrid<Coord, C>>();
    grid.Clear();
    reg.View<const GridPosition<Coord>, ECS::With<C>>(
        [&grid](ECS::EntityId id, const GridPosition<Coord>& pos) { grid.Insert(id, pos); });
}

// PreUpdate system keeping SpatialGrid<Coord, C> current.
template<typename Coord, typename C>
std::unique_ptr<ECS::System> MakeSpatialGridIndexer() {
    return ECS::MakeSystem(std::string("spatial-grid:") + typeid(SpatialGrid<Coord, C>).name(),
        [](ECS::Query<const GridPosition<Coord>, ECS::With<C>> query,
           ECS::ResMut<SpatialGrid<Coord, C>> grid) {
            grid->Clear();
            query.Each([&grid](ECS::EntityId id, const GridPosition<Coord>& pos) {
                grid->Insert(id, pos);
            });
        });
}

} // namespace Incerto::Sim
