#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "voxel.h"

namespace terrain
{

inline constexpr std::uint8_t kHeadroomOpenSky = 255;

// A standable surface: a solid voxel with air directly above it.
struct TileSurface
{
    std::uint8_t y{0};
    std::uint8_t terrainId{0};
    std::uint8_t headroom{0};

    bool operator==(const TileSurface&) const = default;
};

constexpr std::uint8_t materialToTerrain(std::uint8_t material) noexcept
{
    return material;
}

// Read-only per-column surface view of one chunk, consumed by game logic.
class TerrainGrid
{
public:
    static TerrainGrid fromChunk(const VoxelChunk& chunk);

    // Surfaces of column (x, z) sorted bottom to top.
    [[nodiscard]] std::span<const TileSurface> surfacesAt(int x, int z) const noexcept;
    [[nodiscard]] std::size_t surfaceCount() const noexcept;

    // Per column, z-major: count byte, then (y, terrainId, headroom) per surface.
    [[nodiscard]] std::vector<std::uint8_t> toBytes() const;

private:
    std::vector<std::vector<TileSurface>> columns_;
};

} // namespace terrain
