#include <Sim/SpatialGrid.hpp>

#include <cstdlib>

namespace Incerto::Sim {

std::vector<GridCoord2> Neighbors(GridCoord2 c)
{
    std::vector<GridCoord2> out;
    out.reserve(8);
    for (int dy = -1; dy <= 1; ++dy)
        for (int dx = -1; dx <= 1; ++dx)
            if (dx != 0 || dy != 0) out.push_back(c + GridCoord2{ dx, dy });
    return out;
}

std::vector<GridCoord3> Neighbors(GridCoord3 c)
{
    std::vector<GridCoord3> out;
    out.reserve(26);
    for (int dz = -1; dz <= 1; ++dz)
        for (int dy = -1; dy <= 1; ++dy)
            for (int dx = -1; dx <= 1; ++dx)
                if (dx != 0 || dy != 0 || dz != 0) out.push_back(c + GridCoord3{ dx, dy, dz });
    return out;
}

std::vector<GridCoord2> OrthogonalNeighbors(GridCoord2 c)
{
    return { c + GridCoord2{ 0, -1 }, c + GridCoord2{ -1, 0 },
             c + GridCoord2{ 1, 0 },  c + GridCoord2{ 0, 1 } };
}

std::vector<GridCoord3> OrthogonalNeighbors(GridCoord3 c)
{
    return { c + GridCoord3{ -1, 0, 0 }, c + GridCoord3{ 1, 0, 0 },
             c + GridCoord3{ 0, -1, 0 }, c + GridCoord3{ 0, 1, 0 },
             c + GridCoord3{ 0, 0, -1 }, c + GridCoord3{ 0, 0, 1 } };
}

uint32_t ManhattanDistance(GridCoord2 a, GridCoord2 b) noexcept
{
    return static_cast<uint32_t>(std::abs(a.x - b.x) + std::abs(a.y - b.y));
}

uint32_t ManhattanDistance(GridCoord3 a, GridCoord3 b) noexcept
{
    return static_cast<uint32_t>(std::abs(a.x - b.x) + std::abs(a.y - b.y) + std::abs(a.z - b.z));
}

std::vector<GridCoord2> CoordinatesWithinDistance(GridCoord2 c, uint32_t distance)
{
    const int d = static_cast<int>(distance);
    std::vector<GridCoord2> out;
    for (int x = c.x - d; x <= c.x + d; ++x)
        for (int y = c.y - d; y <= c.y + d; ++y) {
            const GridCoord2 p{ x, y };
            if (ManhattanDistance(c, p) <= distance) out.push_back(p);
        }
    return out;
}

std::vector<GridCoord3> CoordinatesWithinDistance(GridCoord3 c, uint32_t distance)
{
    const int d = static_cast<int>(distance);
    std::vector<GridCoord3> out;
    for (int x = c.x - d; x <= c.x + d; ++x)
        for (int y = c.y - d; y <= c.y + d; ++y)
            for (int z = c.z - d; z <= c.z + d; ++z) {
                const GridCoord3 p{ x, y, z };
                if (ManhattanDistance(c, p) <= distance) out.push_back(p);
            }
    return out;
}

bool WithinBounds(GridCoord2 c, GridCoord2 min, GridCoord2 max) noexcept
{
    return c.x >= min.x && c.x <= max.x
        && c.y >= min.y && c.y <= max.y;
}

bool WithinBounds(GridCoord3 c, GridCoord3 min, GridCoord3 max) noexcept
{
    return c.x >= min.x && c.x <= max.x
        && c.y >= min.y && c.y <= max.y
        && c.z >= min.z && c.z <= max.z;
}

} // namespace Incerto::Sim
