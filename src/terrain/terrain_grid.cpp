#include "terrain/terrain_grid.h"

#include <algorithm>
#include <numeric>

namespace terrain
{
namespace
{
inline std::size_t columnIndex(int x, int z) noexcept
{
    return static_cast<std::size_t>(z) * kChunkSize + static_cast<std::size_t>(x);
}

int countHeadroom(const VoxelChunk& chunk, int x, int startY, int z) noexcept
{
    int count = 0;
    for (int y = startY; y < kChunkSize && !isSolidVoxel(chunk.at(x, y, z)); ++y)
    {
        ++count;
    }
    return count;
}
} // namespace

TerrainGrid TerrainGrid::fromChunk(const VoxelChunk& chunk)
{
    TerrainGrid grid;
    grid.columns_.resize(static_cast<std::size_t>(kChunkSize * kChunkSize));

    for (int z = 0; z < kChunkSize; ++z)
    {
        for (int x = 0; x < kChunkSize; ++x)
        {
            auto& surfaces = grid.columns_[columnIndex(x, z)];
            for (int y = 0; y < kChunkSize; ++y)
            {
                const std::uint32_t voxel = chunk.at(x, y, z);
                if (!isSolidVoxel(voxel))
                {
                    continue;
                }

                const std::uint8_t terrainId = materialToTerrain(materialId(voxel));
                if (y == kChunkSize - 1)
                {
                    surfaces.push_back({static_cast<std::uint8_t>(y), terrainId, kHeadroomOpenSky});
                    continue;
                }

                if (!isSolidVoxel(chunk.at(x, y + 1, z)))
                {
                    const int headroom = countHeadroom(chunk, x, y + 1, z);
                    surfaces.push_back(
                        {static_cast<std::uint8_t>(y), terrainId, static_cast<std::uint8_t>(headroom)});
                }
            }
        }
    }

    return grid;
}

std::span<const TileSurface> TerrainGrid::surfacesAt(int x, int z) const noexcept
{
    if (x < 0 || x >= kChunkSize || z < 0 || z >= kChunkSize || columns_.empty())
    {
        return {};
    }
    return columns_[columnIndex(x, z)];
}

std::size_t TerrainGrid::surfaceCount() const noexcept
{
    return std::accumulate(columns_.begin(), columns_.end(), std::size_t{0},
                           [](std::size_t total, const auto& column) { return total + column.size(); });
}

std::vector<std::uint8_t> TerrainGrid::toBytes() const
{
    std::vector<std::uint8_t> bytes;
    bytes.reserve(columns_.size() + surfaceCount() * 3);

    for (const auto& column : columns_)
    {
        bytes.push_back(static_cast<std::uint8_t>(column.size()));
        for (const TileSurface& surface : column)
        {
            bytes.push_back(surface.y);
            bytes.push_back(surface.terrainId);
            bytes.push_back(surface.headroom);
        }
    }

    return bytes;
}

} // namespace terrain
