#include "collision_map.h"

#include <bit>
#include <numeric>
#include <stdexcept>
#include <string>

namespace
{
inline bool inChunkBounds(int x, int y, int z) noexcept
{
    return x >= 0 && x < kChunkSize && y >= 0 && y < kChunkSize && z >= 0 && z < kChunkSize;
}
} // namespace

CollisionMap CollisionMap::fromVoxels(std::span<const std::uint32_t> voxels)
{
    if (voxels.size() != kBitCount)
    {
        throw std::invalid_argument("CollisionMap requires " + std::to_string(kBitCount) + " voxels, got "
                                    + std::to_string(voxels.size()));
    }

    CollisionMap map;
    for (std::size_t i = 0; i < voxels.size(); ++i)
    {
        if (isSolidVoxel(voxels[i]))
        {
            map.bits_[i / 8] |= static_cast<std::uint8_t>(1u << (i % 8));
        }
    }
    return map;
}

bool CollisionMap::isSolid(int x, int y, int z) const noexcept
{
    if (!inChunkBounds(x, y, z))
    {
        return false;
    }
    const std::size_t index = voxelIndex(x, y, z);
    return ((bits_[index / 8] >> (index % 8)) & 1u) != 0;
}

std::size_t CollisionMap::solidCount() const noexcept
{
    return std::accumulate(bits_.begin(), bits_.end(), std::size_t{0}, [](std::size_t total, std::uint8_t byte) {
        return total + static_cast<std::size_t>(std::popcount(byte));
    });
}

bool CollisionMap::crossesVoxelBoundary(const glm::vec3& oldPos, const glm::vec3& newPos) noexcept
{
    return glm::floor(oldPos) != glm::floor(newPos);
}
